/// @file
/// @brief Binary MIDI stream helper implementations (VLQ, big-endian I/O, tempo).

#include "midi/midi_stream.h"

#include <algorithm>

namespace morse {

namespace {

/// @brief Append the low `width` bytes of value, most significant first.
void appendBigEndian(std::vector<uint8_t>& buf, uint32_t value, int width) {
  for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
    buf.push_back(static_cast<uint8_t>(value >> shift));
  }
}

/// @brief Load `width` bytes at data[offset] as a big-endian unsigned value.
uint32_t loadBigEndian(const uint8_t* data, size_t offset, int width) {
  uint32_t value = 0;
  for (int idx = 0; idx < width; ++idx) {
    value = (value << 8) | data[offset + idx];
  }
  return value;
}

}  // namespace

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  value = std::min(value, kMaxVariableLength);

  // Fill from the back: terminal group first, then each higher group is
  // prepended with the continuation bit set.
  uint8_t groups[kMaxVariableLengthBytes];
  size_t first = kMaxVariableLengthBytes - 1;
  groups[first] = static_cast<uint8_t>(value & 0x7F);
  for (value >>= 7; value != 0; value >>= 7) {
    groups[--first] = static_cast<uint8_t>(0x80 | (value & 0x7F));
  }
  buf.insert(buf.end(), groups + first, groups + kMaxVariableLengthBytes);
}

std::vector<uint8_t> encodeVariableLength(uint32_t value) {
  std::vector<uint8_t> buf;
  buf.reserve(kMaxVariableLengthBytes);
  writeVariableLength(buf, value);
  return buf;
}

size_t variableLengthSize(uint32_t value) {
  if (value < (1u << 7)) return 1;
  if (value < (1u << 14)) return 2;
  if (value < (1u << 21)) return 3;
  return 4;
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  uint32_t value = 0;
  for (size_t count = 0; count < kMaxVariableLengthBytes && offset < max_size; ++count) {
    const uint8_t byte = data[offset++];
    value = (value << 7) + (byte & 0x7F);
    if (!(byte & 0x80)) break;
  }
  return value;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  appendBigEndian(buf, value, 2);
}

void writeBE24(std::vector<uint8_t>& buf, uint32_t value) {
  appendBigEndian(buf, value, 3);
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  appendBigEndian(buf, value, 4);
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(loadBigEndian(data, offset, 2));
}

uint32_t readBE24(const uint8_t* data, size_t offset) {
  return loadBigEndian(data, offset, 3);
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return loadBigEndian(data, offset, 4);
}

uint32_t tempoFromBpm(uint32_t bpm) {
  if (bpm == 0) {
    return 0;
  }
  return kMicrosecondsPerMinute / bpm;
}

bool isTempoEncodable(uint32_t bpm) {
  uint32_t tempo = tempoFromBpm(bpm);
  return tempo > 0 && tempo <= kMaxTempoMicroseconds;
}

}  // namespace morse
