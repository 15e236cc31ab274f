/// @file
/// @brief Command-line option parsing for morse_cli.

#include "cli_options.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace morse {

bool parseBpm(const char* text, uint32_t& bpm, std::string& error) {
  // strtoull accepts leading whitespace and a sign; only digits are valid here.
  const bool digits_only = text[0] != '\0' && std::strspn(text, "0123456789") ==
                                                  std::strlen(text);
  if (!digits_only) {
    error = std::string("invalid value \"") + text + "\" for flag --bpm";
    return false;
  }

  errno = 0;
  unsigned long long value = std::strtoull(text, nullptr, 10);
  if (errno == ERANGE || value > UINT32_MAX) {
    error = "invalid bpm " + std::string(text) + ": must be between " +
            std::to_string(kMinBpm) + " and " + std::to_string(kMaxBpm);
    return false;
  }
  bpm = static_cast<uint32_t>(value);
  return true;
}

ParseStatus parseArgs(int argc, const char* const argv[], CliOptions& opts,
                      std::string& error) {
  bool positional_only = false;
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool is_option = !positional_only && arg[0] == '-' && arg[1] != '\0';
    if (!is_option) {
      opts.words.push_back(arg);
      continue;
    }

    if (std::strcmp(arg, "--") == 0) {
      positional_only = true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      return ParseStatus::Help;
    } else if (std::strcmp(arg, "--bpm") == 0) {
      if (idx + 1 >= argc) {
        error = "flag needs an argument: --bpm";
        return ParseStatus::Error;
      }
      if (!parseBpm(argv[++idx], opts.bpm, error)) return ParseStatus::Error;
    } else if (std::strncmp(arg, "--bpm=", 6) == 0) {
      if (!parseBpm(arg + 6, opts.bpm, error)) return ParseStatus::Error;
    } else if (std::strcmp(arg, "-o") == 0) {
      if (idx + 1 >= argc) {
        error = "flag needs an argument: -o";
        return ParseStatus::Error;
      }
      opts.output = argv[++idx];
    } else if (std::strcmp(arg, "--verify") == 0) {
      opts.verify = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      error = std::string("flag provided but not defined: ") + arg;
      return ParseStatus::Error;
    }
  }
  return ParseStatus::Ok;
}

GeneratorConfig buildGeneratorConfig(const CliOptions& opts) {
  GeneratorConfig config;
  for (size_t idx = 0; idx < opts.words.size(); ++idx) {
    if (idx > 0) config.text += ' ';
    config.text += opts.words[idx];
  }
  config.bpm = opts.bpm;
  config.output_path = opts.output;
  config.verbose = opts.verbose;
  return config;
}

}  // namespace morse
