// Reader for Morse MIDI files: one format 0 track carrying a tempo, single-voice
// notes on channel 0, and End of Track.

#ifndef MORSE_MIDI_MIDI_READER_H
#define MORSE_MIDI_MIDI_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace morse {

/// Contents of a Morse MIDI file.
struct ParsedMidi {
  uint16_t format = 0;
  uint16_t num_tracks = 0;
  uint16_t division = 0;
  uint32_t tempo_usec = 0;        ///< Last Set Tempo value (0 = none seen).
  uint32_t bpm = 0;               ///< Derived from tempo_usec (0 = none seen).
  uint32_t tempo_event_count = 0;
  std::vector<NoteEvent> notes;   ///< In start order; never overlapping.
  Tick end_tick = 0;              ///< Absolute tick of End of Track.
};

/// @brief Parses the files MidiWriter produces and rejects anything else.
///
/// Accepted track events: Set Tempo, note-on/note-off on channel 0 (note-on
/// with velocity 0 counts as note-off), other meta-events (skipped), and a
/// final End of Track. A read fails on:
///   - a header other than format 0 with one track
///   - a truncated chunk or event
///   - any other status byte (running status, SysEx, other channels or messages)
///   - a note-on while a note is sounding, or an unmatched note-off
///   - a note still sounding at End of Track, data after it, or no End of Track
class MidiReader {
 public:
  MidiReader() = default;

  /// @brief Read and parse a MIDI file from disk.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Parse MIDI file bytes.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::vector<uint8_t>& data);

  /// @brief Parsed contents (valid after a successful read).
  const ParsedMidi& getParsedMidi() const { return midi_; }

  /// @brief Reason for the last failed read().
  const std::string& getError() const { return error_; }

 private:
  ParsedMidi midi_;
  std::string error_;

  /// Parse MThd; leaves offset at the first byte after the header chunk.
  bool parseHeader(const std::vector<uint8_t>& data, size_t& offset);

  /// Parse the events of the MTrk payload data[begin, end).
  bool parseEvents(const uint8_t* data, size_t begin, size_t end);

  /// Record a failure message and return false.
  bool fail(const std::string& message);
};

}  // namespace morse

#endif  // MORSE_MIDI_MIDI_READER_H
