// Text to Morse MIDI pipeline.

#ifndef MORSE_GENERATOR_H
#define MORSE_GENERATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace morse {

/// @brief Failure category reported by the pipeline.
enum class ErrorKind : uint8_t {
  None,
  Input,       ///< Text empty or all whitespace.
  Config,      ///< BPM outside [kMinBpm, kMaxBpm].
  Persistence  ///< Output file could not be written.
};

/// @brief Convert ErrorKind to human-readable string.
const char* errorKindToString(ErrorKind kind);

/// @brief Configuration for one text-to-MIDI conversion.
struct GeneratorConfig {
  std::string text;
  uint32_t bpm = kDefaultBpm;
  std::string output_path;  ///< Empty = derive from text.
  bool verbose = false;     ///< Log pipeline details to stderr.
};

/// @brief Result of generate(), updated by writeResult().
struct GeneratorResult {
  bool success = false;
  ErrorKind error = ErrorKind::None;
  std::string error_message;
  std::string morse;
  std::vector<uint8_t> midi_bytes;
  std::string output_path;
  uint32_t note_count = 0;
  Tick total_duration_ticks = 0;
  uint32_t tempo_usec = 0;
};

/// @brief Check whether text is empty or consists only of whitespace.
bool isBlankText(const std::string& text);

/// @brief Derive the output file name: spaces become '-', ".mid" is appended.
std::string outputFileNameForText(const std::string& text);

/// @brief Convert text to a Morse MIDI buffer. Performs no file I/O.
///
/// Fails with ErrorKind::Input for blank text and ErrorKind::Config for a BPM
/// whose tempo does not fit the 3-byte tempo field.
///
/// @param config Conversion configuration.
/// @return GeneratorResult with morse stream and midi_bytes on success.
GeneratorResult generate(const GeneratorConfig& config);

/// @brief Persist result.midi_bytes to result.output_path in one write.
///
/// On failure sets success to false, error to ErrorKind::Persistence and
/// error_message to the operating system's reason.
///
/// @param result A successful result from generate().
/// @return True if the file was written.
bool writeResult(GeneratorResult& result);

/// @brief Read back result.output_path and compare it with the result.
/// @param result A result that has been written with writeResult().
/// @param error Receives a description of the first mismatch.
/// @return True if the file parses and matches note count, tempo and length.
bool verifyResult(const GeneratorResult& result, std::string& error);

}  // namespace morse

#endif  // MORSE_GENERATOR_H
