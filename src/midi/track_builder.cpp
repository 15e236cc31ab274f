/// @file
/// @brief Morse symbol stream to MTrk event data.

#include "midi/track_builder.h"

#include "midi/midi_stream.h"

namespace morse {

TrackBuilder::TrackBuilder(uint32_t bpm) {
  // Tempo (7) + End of Track (3-6) + ~8 bytes per note.
  data_.reserve(64);
  writeTempo(tempoFromBpm(bpm));
}

void TrackBuilder::addSymbol(MorseSymbol symbol) {
  if (finished_) return;

  Tick duration = noteDurationFor(symbol);
  if (duration > 0) {
    writeNote(duration);
  }
  pending_delta_ = gapAfter(symbol);
}

void TrackBuilder::addMorse(const std::string& morse) {
  data_.reserve(data_.size() + morse.size() * 8);
  for (char chr : morse) {
    MorseSymbol symbol;
    if (morseSymbolFromChar(chr, symbol)) {
      addSymbol(symbol);
    }
  }
}

void TrackBuilder::finish() {
  if (finished_) return;

  writeVariableLength(data_, pending_delta_);
  data_.push_back(kMetaEvent);
  data_.push_back(kMetaEndOfTrack);
  data_.push_back(0x00);
  total_ticks_ += pending_delta_;
  pending_delta_ = 0;
  finished_ = true;
}

void TrackBuilder::writeTempo(uint32_t usec_per_beat) {
  tempo_usec_ = usec_per_beat;
  writeVariableLength(data_, 0);
  data_.push_back(kMetaEvent);
  data_.push_back(kMetaSetTempo);
  data_.push_back(0x03);  // Length = 3 bytes
  writeBE24(data_, usec_per_beat);
}

void TrackBuilder::writeNote(Tick duration) {
  writeVariableLength(data_, pending_delta_);
  data_.push_back(kNoteOn);
  data_.push_back(kMorseNote);
  data_.push_back(kMorseVelocity);

  writeVariableLength(data_, duration);
  data_.push_back(kNoteOff);
  data_.push_back(kMorseNote);
  data_.push_back(0x00);

  total_ticks_ += pending_delta_ + duration;
  ++note_count_;
}

}  // namespace morse
