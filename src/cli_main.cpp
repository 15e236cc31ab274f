/// @file
/// @brief CLI entry point for the Morse MIDI converter.

#include <cstdio>
#include <string>

#include "cli_options.h"
#include "core/basic_types.h"
#include "core/version_info.h"
#include "generator.h"

namespace {

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("morse_cli %s - Convert text to Morse code MIDI\n\n", MORSE_VERSION);
  std::printf("Usage: morse_cli [options] <text...>\n\n");
  std::printf("Options:\n");
  std::printf("  --bpm N          Tempo in beats per minute (default %u, range %u-%u)\n",
              morse::kDefaultBpm, morse::kMinBpm, morse::kMaxBpm);
  std::printf("  -o FILE          Output file path (default: text with '-' for spaces + .mid)\n");
  std::printf("  --verify         Read the written file back and check it\n");
  std::printf("  --verbose        Log encoding details to stderr\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nLetters a-z are encoded; other characters are skipped.\n");
}

/// @brief Report a top-level failure and return the process exit code.
int fail(const std::string& message) {
  std::printf("Error: %s\n", message.c_str());
  std::printf("Use --help for more information.\n");
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  morse::CliOptions opts;
  std::string error;
  switch (morse::parseArgs(argc, argv, opts, error)) {
    case morse::ParseStatus::Help:
      printUsage();
      return 0;
    case morse::ParseStatus::Error:
      return fail(error);
    case morse::ParseStatus::Ok:
      break;
  }

  morse::GeneratorConfig config = morse::buildGeneratorConfig(opts);
  std::printf("Input text: %s\n", config.text.c_str());

  morse::GeneratorResult result = morse::generate(config);
  if (!result.success) {
    return fail(result.error_message);
  }
  std::printf("Morse code: %s\n", result.morse.c_str());

  if (!morse::writeResult(result)) {
    std::printf("Error writing MIDI file: %s\n", result.error_message.c_str());
    return fail(result.error_message);
  }
  std::printf("MIDI file saved as %s\n", result.output_path.c_str());

  if (opts.verify) {
    if (!morse::verifyResult(result, error)) {
      return fail("verification failed: " + error);
    }
    std::printf("Verified:   %u notes, %u ticks, %u us/beat\n", result.note_count,
                result.total_duration_ticks, result.tempo_usec);
  }

  return 0;
}
