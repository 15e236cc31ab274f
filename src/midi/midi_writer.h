// MIDI writer for Morse output. Writes SMF Type 0 files from a Morse stream.

#ifndef MORSE_MIDI_MIDI_WRITER_H
#define MORSE_MIDI_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace morse {

/// @brief MIDI file writer that produces Standard MIDI File (SMF) Type 0 output.
///
/// The file is one MThd chunk (format 0, one track, kTicksPerBeat division)
/// followed by one MTrk chunk built by TrackBuilder.
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Build complete MIDI data from a Morse stream.
  /// @param morse Symbol stream ('.', '-', ' ', '/').
  /// @param bpm Tempo in beats per minute. Must satisfy isTempoEncodable().
  void build(const std::string& morse, uint32_t bpm);

  /// @brief Get the binary MIDI data after build().
  /// @return Byte vector containing complete SMF Type 0 data.
  std::vector<uint8_t> toBytes() const;

  /// @brief Write built MIDI data to a file in a single write.
  /// @param path Output file path.
  /// @return True if the file was written successfully. On failure, call
  ///         getError() for details.
  bool writeToFile(const std::string& path);

  /// @brief Write arbitrary bytes to a file in a single write.
  /// @param path Output file path.
  /// @param data Bytes to write.
  /// @param error Receives "<path>: <reason>" on failure.
  /// @return True on success.
  static bool writeBytes(const std::string& path, const std::vector<uint8_t>& data,
                         std::string& error);

  /// @brief Get the error message from the last failed writeToFile().
  const std::string& getError() const { return error_; }

  /// @brief Note pairs written by the last build().
  uint32_t noteCount() const { return note_count_; }

  /// @brief Track duration in ticks from the last build().
  Tick totalTicks() const { return total_ticks_; }

  /// @brief Tempo (microseconds per beat) from the last build().
  uint32_t tempoMicroseconds() const { return tempo_usec_; }

 private:
  std::vector<uint8_t> data_;
  std::string error_;
  uint32_t note_count_ = 0;
  Tick total_ticks_ = 0;
  uint32_t tempo_usec_ = 0;

  /// Write the MThd (file header) chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  /// Wrap finished event data in an MTrk chunk.
  void writeTrackChunk(const std::vector<uint8_t>& track_buf);
};

}  // namespace morse

#endif  // MORSE_MIDI_MIDI_WRITER_H
