/// @file
/// @brief SMF Type 0 MIDI file writer implementation.

#include "midi/midi_writer.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "midi/midi_stream.h"
#include "midi/track_builder.h"

namespace morse {

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const std::string& morse, uint32_t bpm) {
  data_.clear();

  TrackBuilder builder(bpm);
  builder.addMorse(morse);
  builder.finish();

  note_count_ = builder.noteCount();
  total_ticks_ = builder.totalTicks();
  tempo_usec_ = builder.tempoMicroseconds();

  data_.reserve(14 + 8 + builder.data().size());
  writeHeader(1, static_cast<uint16_t>(kTicksPerBeat));
  writeTrackChunk(builder.data());
}

std::vector<uint8_t> MidiWriter::toBytes() const {
  return data_;
}

bool MidiWriter::writeToFile(const std::string& path) {
  error_.clear();
  return writeBytes(path, data_, error_);
}

bool MidiWriter::writeBytes(const std::string& path, const std::vector<uint8_t>& data,
                            std::string& error) {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    error = "open " + path + ": " + std::strerror(errno);
    return false;
  }
  errno = 0;
  size_t written = std::fwrite(data.data(), 1, data.size(), file);
  int write_errno = errno;
  errno = 0;
  int close_status = std::fclose(file);
  int close_errno = errno;

  if (written != data.size()) {
    error = "write " + path + ": " +
            (write_errno != 0 ? std::string(std::strerror(write_errno))
                              : "short write (" + std::to_string(written) + " of " +
                                    std::to_string(data.size()) + " bytes)");
    return false;
  }
  if (close_status != 0) {
    error = "close " + path + ": " +
            (close_errno != 0 ? std::string(std::strerror(close_errno)) : "unknown error");
    return false;
  }
  return true;
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  // "MThd" chunk identifier
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('h');
  data_.push_back('d');

  // Header length: always 6
  writeBE32(data_, 6);

  // Format: 0 (single track)
  writeBE16(data_, 0);

  // Number of tracks
  writeBE16(data_, num_tracks);

  // Division (ticks per quarter note)
  writeBE16(data_, division);
}

void MidiWriter::writeTrackChunk(const std::vector<uint8_t>& track_buf) {
  data_.push_back('M');
  data_.push_back('T');
  data_.push_back('r');
  data_.push_back('k');
  writeBE32(data_, static_cast<uint32_t>(track_buf.size()));
  data_.insert(data_.end(), track_buf.begin(), track_buf.end());
}

}  // namespace morse
