/// @file
/// @brief Morse MIDI file reader implementation.

#include "midi/midi_reader.h"

#include <cstdio>
#include <cstring>

#include "midi/midi_stream.h"

namespace morse {

namespace {

constexpr size_t kChunkHeaderSize = 8;  // 4-byte tag + 4-byte length
constexpr uint32_t kMinHeaderLength = 6;

/// @brief Format a byte as "0xNN" for error messages.
std::string hexByte(uint8_t value) {
  char text[8];
  std::snprintf(text, sizeof(text), "0x%02X", value);
  return text;
}

/// @brief Format a tick position suffix for error messages.
std::string atTick(Tick tick) {
  return " at tick " + std::to_string(tick);
}

}  // namespace

bool MidiReader::read(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    return fail("Failed to open file: " + path);
  }

  std::vector<uint8_t> data;
  uint8_t block[4096];
  size_t got = 0;
  while ((got = std::fread(block, 1, sizeof(block), file)) > 0) {
    data.insert(data.end(), block, block + got);
  }
  bool read_error = std::ferror(file) != 0;
  std::fclose(file);

  if (read_error) {
    return fail("Failed to read file: " + path);
  }
  return read(data);
}

bool MidiReader::read(const std::vector<uint8_t>& data) {
  midi_ = ParsedMidi{};
  error_.clear();

  size_t offset = 0;
  if (!parseHeader(data, offset)) {
    return false;
  }

  if (data.size() - offset < kChunkHeaderSize) {
    return fail("Unexpected end of data before MTrk chunk");
  }
  if (std::memcmp(data.data() + offset, "MTrk", 4) != 0) {
    return fail("Invalid track chunk: missing MTrk tag");
  }
  const uint32_t track_length = readBE32(data.data(), offset + 4);
  offset += kChunkHeaderSize;
  if (track_length > data.size() - offset) {
    return fail("MTrk length " + std::to_string(track_length) + " exceeds file size");
  }

  return parseEvents(data.data(), offset, offset + track_length);
}

bool MidiReader::parseHeader(const std::vector<uint8_t>& data, size_t& offset) {
  if (data.size() < kChunkHeaderSize + kMinHeaderLength) {
    return fail("Data too small to be a MIDI file");
  }
  if (std::memcmp(data.data(), "MThd", 4) != 0) {
    return fail("Invalid MIDI file: missing MThd header");
  }

  const uint32_t header_length = readBE32(data.data(), 4);
  if (header_length < kMinHeaderLength ||
      header_length > data.size() - kChunkHeaderSize) {
    return fail("Invalid MThd length " + std::to_string(header_length));
  }

  midi_.format = readBE16(data.data(), 8);
  midi_.num_tracks = readBE16(data.data(), 10);
  midi_.division = readBE16(data.data(), 12);

  if (midi_.format != 0) {
    return fail("Expected format 0, got format " + std::to_string(midi_.format));
  }
  if (midi_.num_tracks != 1) {
    return fail("Expected 1 track, got " + std::to_string(midi_.num_tracks));
  }

  offset = kChunkHeaderSize + header_length;
  return true;
}

bool MidiReader::parseEvents(const uint8_t* data, size_t begin, size_t end) {
  size_t pos = begin;
  Tick now = 0;

  bool sounding = false;
  NoteEvent current;

  while (pos < end) {
    const size_t delta_start = pos;
    now += readVariableLength(data, pos, end);
    if (data[pos - 1] & 0x80) {
      return fail("Truncated delta-time at byte " + std::to_string(delta_start));
    }
    if (pos >= end) {
      return fail("Delta-time without event" + atTick(now));
    }

    const uint8_t status = data[pos++];

    if (status == kMetaEvent) {
      if (pos >= end) {
        return fail("Truncated meta-event" + atTick(now));
      }
      const uint8_t type = data[pos++];
      const size_t length_start = pos;
      const uint32_t length = readVariableLength(data, pos, end);
      if (pos == length_start || (data[pos - 1] & 0x80) || length > end - pos) {
        return fail("Meta-event " + hexByte(type) + " exceeds track" + atTick(now));
      }

      if (type == kMetaSetTempo) {
        if (length != 3) {
          return fail("Set Tempo with length " + std::to_string(length) + atTick(now));
        }
        midi_.tempo_usec = readBE24(data, pos);
        midi_.bpm = midi_.tempo_usec > 0 ? kMicrosecondsPerMinute / midi_.tempo_usec : 0;
        ++midi_.tempo_event_count;
      } else if (type == kMetaEndOfTrack) {
        if (sounding) {
          return fail("Note still sounding at End of Track" + atTick(now));
        }
        if (pos + length != end) {
          return fail("Data after End of Track" + atTick(now));
        }
        midi_.end_tick = now;
        return true;
      }
      pos += length;
      continue;
    }

    if (status != kNoteOn && status != kNoteOff) {
      return fail("Unexpected status byte " + hexByte(status) + atTick(now));
    }
    if (end - pos < 2) {
      return fail("Truncated note event" + atTick(now));
    }
    const uint8_t pitch = data[pos++];
    const uint8_t velocity = data[pos++];
    if ((pitch | velocity) & 0x80) {
      return fail("Note data byte out of range" + atTick(now));
    }

    if (status == kNoteOn && velocity > 0) {
      if (sounding) {
        return fail("Note-on while a note is sounding" + atTick(now));
      }
      sounding = true;
      current.start_tick = now;
      current.pitch = pitch;
      current.velocity = velocity;
    } else {
      if (!sounding || pitch != current.pitch) {
        return fail("Note-off without matching note-on" + atTick(now));
      }
      sounding = false;
      current.duration = now - current.start_tick;
      midi_.notes.push_back(current);
    }
  }

  return fail("Track ends without End of Track");
}

bool MidiReader::fail(const std::string& message) {
  error_ = message;
  return false;
}

}  // namespace morse
