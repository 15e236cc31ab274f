/// @file
/// @brief Text to Morse MIDI pipeline: validation, mapping, encoding, output.

#include "generator.h"

#include <cctype>
#include <cstdio>

#include "midi/midi_reader.h"
#include "midi/midi_writer.h"
#include "morse/morse_mapper.h"

namespace morse {

namespace {

constexpr const char* kNoTextMessage =
    "no text provided, please provide text to convert to Morse code";

/// @brief Fill a failed result.
GeneratorResult failure(ErrorKind kind, const std::string& message) {
  GeneratorResult result;
  result.success = false;
  result.error = kind;
  result.error_message = message;
  return result;
}

}  // namespace

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:        return "None";
    case ErrorKind::Input:       return "Input";
    case ErrorKind::Config:      return "Config";
    case ErrorKind::Persistence: return "Persistence";
  }
  return "Unknown";
}

bool isBlankText(const std::string& text) {
  for (char chr : text) {
    if (!std::isspace(static_cast<unsigned char>(chr))) {
      return false;
    }
  }
  return true;
}

std::string outputFileNameForText(const std::string& text) {
  std::string name = text;
  for (char& chr : name) {
    if (chr == ' ') chr = '-';
  }
  return name + ".mid";
}

GeneratorResult generate(const GeneratorConfig& config) {
  if (isBlankText(config.text)) {
    return failure(ErrorKind::Input, kNoTextMessage);
  }
  if (config.bpm < kMinBpm || config.bpm > kMaxBpm) {
    return failure(ErrorKind::Config,
                   "invalid bpm " + std::to_string(config.bpm) + ": must be between " +
                       std::to_string(kMinBpm) + " and " + std::to_string(kMaxBpm));
  }

  GeneratorResult result;
  result.morse = textToMorse(config.text);

  MidiWriter writer;
  writer.build(result.morse, config.bpm);
  result.midi_bytes = writer.toBytes();
  result.note_count = writer.noteCount();
  result.total_duration_ticks = writer.totalTicks();
  result.tempo_usec = writer.tempoMicroseconds();
  result.output_path = config.output_path.empty() ? outputFileNameForText(config.text)
                                                  : config.output_path;
  result.success = true;

  if (config.verbose) {
    std::fprintf(stderr, "[generate] %zu symbols -> %u notes, %u ticks, tempo %u us/beat\n",
                 result.morse.size(), result.note_count, result.total_duration_ticks,
                 result.tempo_usec);
    std::fprintf(stderr, "[generate] %zu bytes for %s\n", result.midi_bytes.size(),
                 result.output_path.c_str());
  }
  return result;
}

bool writeResult(GeneratorResult& result) {
  std::string error;
  if (!MidiWriter::writeBytes(result.output_path, result.midi_bytes, error)) {
    result.success = false;
    result.error = ErrorKind::Persistence;
    result.error_message = error;
    return false;
  }
  return true;
}

bool verifyResult(const GeneratorResult& result, std::string& error) {
  MidiReader reader;
  if (!reader.read(result.output_path)) {
    error = reader.getError();
    return false;
  }

  const ParsedMidi& midi = reader.getParsedMidi();
  if (midi.division != kTicksPerBeat) {
    error = "division " + std::to_string(midi.division) + " != " +
            std::to_string(kTicksPerBeat);
    return false;
  }
  if (midi.tempo_event_count != 1 || midi.tempo_usec != result.tempo_usec) {
    error = "tempo mismatch: read " + std::to_string(midi.tempo_usec) + " us/beat";
    return false;
  }
  if (midi.notes.size() != result.note_count) {
    error = "note count mismatch: read " + std::to_string(midi.notes.size()) +
            ", expected " + std::to_string(result.note_count);
    return false;
  }
  if (midi.end_tick != result.total_duration_ticks) {
    error = "End of Track at tick " + std::to_string(midi.end_tick) + ", expected " +
            std::to_string(result.total_duration_ticks);
    return false;
  }
  return true;
}

}  // namespace morse
