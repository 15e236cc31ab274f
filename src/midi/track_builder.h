// Morse track builder: turns a Morse symbol stream into MTrk event data.

#ifndef MORSE_MIDI_TRACK_BUILDER_H
#define MORSE_MIDI_TRACK_BUILDER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace morse {

/// @brief Append-only builder for the event data of a single MTrk chunk.
///
/// Construction writes the tempo meta-event at delta 0. Each dot or dash then
/// emits a note-on/note-off pair on kMorseNote, preceded by the pending
/// delta-time. Gaps emit nothing and only set the pending delta:
///
///   symbol   note length   next pending delta
///   '.'      kDot          kDot
///   '-'      kDash         kDot
///   ' '      -             kLetterGap
///   '/'      -             kPause
///
/// finish() writes the last pending delta followed by End of Track. The
/// buffer does not include the "MTrk" tag or length; MidiWriter adds those.
class TrackBuilder {
 public:
  /// @param bpm Tempo in beats per minute. Caller guarantees
  ///        isTempoEncodable(bpm).
  explicit TrackBuilder(uint32_t bpm);

  /// @brief Consume one symbol. Ignored after finish().
  void addSymbol(MorseSymbol symbol);

  /// @brief Consume every character of a Morse stream.
  /// Characters outside the Morse alphabet are skipped.
  void addMorse(const std::string& morse);

  /// @brief Write the trailing delta and End of Track. Later calls are no-ops.
  void finish();

  /// @brief Track event bytes built so far.
  const std::vector<uint8_t>& data() const { return data_; }

  bool isFinished() const { return finished_; }

  /// @brief Number of note-on/note-off pairs emitted.
  uint32_t noteCount() const { return note_count_; }

  /// @brief Sum of every delta-time and note length written so far.
  Tick totalTicks() const { return total_ticks_; }

  /// @brief Delta-time that will precede the next event.
  Tick pendingDelta() const { return pending_delta_; }

  /// @brief Tempo written in the tempo meta-event (microseconds per beat).
  uint32_t tempoMicroseconds() const { return tempo_usec_; }

 private:
  std::vector<uint8_t> data_;
  Tick pending_delta_ = 0;
  Tick total_ticks_ = 0;
  uint32_t note_count_ = 0;
  uint32_t tempo_usec_ = 0;
  bool finished_ = false;

  /// Write the Set Tempo meta-event (FF 51 03 tt tt tt) at delta 0.
  void writeTempo(uint32_t usec_per_beat);

  /// Write one note-on/note-off pair after the pending delta.
  void writeNote(Tick duration);
};

}  // namespace morse

#endif  // MORSE_MIDI_TRACK_BUILDER_H
