// Command-line option parsing for morse_cli.

#ifndef MORSE_CLI_OPTIONS_H
#define MORSE_CLI_OPTIONS_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "generator.h"

namespace morse {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::vector<std::string> words;
  uint32_t bpm = kDefaultBpm;
  std::string output;
  bool verify = false;
  bool verbose = false;
};

enum class ParseStatus { Ok, Help, Error };

/// @brief Parse a --bpm value. Accepts a plain decimal integer only.
///
/// Range checking against kMinBpm/kMaxBpm is left to generate(); values that
/// do not fit uint32_t are rejected here.
/// @param text Option value.
/// @param bpm Receives the value on success.
/// @param error Receives the reason on failure.
/// @return False for empty, signed, non-numeric or oversized input.
bool parseBpm(const char* text, uint32_t& bpm, std::string& error);

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param error Receives the reason on ParseStatus::Error.
/// @return Help if --help or -h was given (caller prints usage, exits 0).
ParseStatus parseArgs(int argc, const char* const argv[], CliOptions& opts,
                      std::string& error);

/// @brief Build a GeneratorConfig from parsed CLI options.
/// Positional words are joined with single spaces.
GeneratorConfig buildGeneratorConfig(const CliOptions& opts);

}  // namespace morse

#endif  // MORSE_CLI_OPTIONS_H
