// Tests for midi/midi_stream.h -- VLQ, big-endian helpers, tempo.

#include "midi/midi_stream.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace morse {
namespace {

/// @brief Decode a complete buffer as one VLQ, returning the consumed length.
uint32_t decodeAll(const std::vector<uint8_t>& buf, size_t& consumed) {
  size_t offset = 0;
  uint32_t value = readVariableLength(buf.data(), offset, buf.size());
  consumed = offset;
  return value;
}

// ---------------------------------------------------------------------------
// VLQ literal vectors
// ---------------------------------------------------------------------------

TEST(MidiStreamTest, VariableLengthLiteralVectors) {
  EXPECT_EQ(encodeVariableLength(0), (std::vector<uint8_t>{0x00}));
  EXPECT_EQ(encodeVariableLength(64), (std::vector<uint8_t>{0x40}));
  EXPECT_EQ(encodeVariableLength(127), (std::vector<uint8_t>{0x7F}));
  EXPECT_EQ(encodeVariableLength(128), (std::vector<uint8_t>{0x81, 0x00}));
  EXPECT_EQ(encodeVariableLength(8192), (std::vector<uint8_t>{0xC0, 0x00}));
  EXPECT_EQ(encodeVariableLength(16383), (std::vector<uint8_t>{0xFF, 0x7F}));
  EXPECT_EQ(encodeVariableLength(16384), (std::vector<uint8_t>{0x81, 0x80, 0x00}));
  EXPECT_EQ(encodeVariableLength(2097151), (std::vector<uint8_t>{0xFF, 0xFF, 0x7F}));
  EXPECT_EQ(encodeVariableLength(2097152), (std::vector<uint8_t>{0x81, 0x80, 0x80, 0x00}));
  EXPECT_EQ(encodeVariableLength(0x0FFFFFFF), (std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0x7F}));
}

TEST(MidiStreamTest, VariableLengthTimingConstants) {
  EXPECT_EQ(encodeVariableLength(48), (std::vector<uint8_t>{0x30}));
  EXPECT_EQ(encodeVariableLength(144), (std::vector<uint8_t>{0x81, 0x10}));
  EXPECT_EQ(encodeVariableLength(192), (std::vector<uint8_t>{0x81, 0x40}));
  EXPECT_EQ(encodeVariableLength(336), (std::vector<uint8_t>{0x82, 0x50}));
}

TEST(MidiStreamTest, WriteVariableLengthAppends) {
  std::vector<uint8_t> buf = {0xAA};
  writeVariableLength(buf, 128);
  writeVariableLength(buf, 0);
  EXPECT_EQ(buf, (std::vector<uint8_t>{0xAA, 0x81, 0x00, 0x00}));
}

TEST(MidiStreamTest, VariableLengthClampsAboveMaximum) {
  EXPECT_EQ(encodeVariableLength(0xFFFFFFFF), encodeVariableLength(kMaxVariableLength));
  EXPECT_EQ(variableLengthSize(0xFFFFFFFF), 4u);
}

// ---------------------------------------------------------------------------
// VLQ round trip and minimality
// ---------------------------------------------------------------------------

TEST(MidiStreamTest, VariableLengthRoundTripDense) {
  for (uint32_t value = 0; value < (1u << 21) + 4096; ++value) {
    std::vector<uint8_t> buf = encodeVariableLength(value);
    size_t consumed = 0;
    ASSERT_EQ(decodeAll(buf, consumed), value);
    ASSERT_EQ(consumed, buf.size()) << "value " << value;
  }
}

TEST(MidiStreamTest, VariableLengthRoundTripSparse) {
  for (uint64_t value = 0; value <= kMaxVariableLength; value += 65521) {
    auto val32 = static_cast<uint32_t>(value);
    std::vector<uint8_t> buf = encodeVariableLength(val32);
    size_t consumed = 0;
    ASSERT_EQ(decodeAll(buf, consumed), val32);
    ASSERT_EQ(consumed, buf.size());
  }
}

TEST(MidiStreamTest, VariableLengthIsMinimal) {
  for (uint32_t value = 0; value < (1u << 22); value += 7) {
    std::vector<uint8_t> buf = encodeVariableLength(value);
    // Only the last byte clears the continuation bit.
    for (size_t idx = 0; idx + 1 < buf.size(); ++idx) {
      ASSERT_NE(buf[idx] & 0x80, 0) << "value " << value;
    }
    ASSERT_EQ(buf.back() & 0x80, 0) << "value " << value;
    // No redundant leading zero group.
    if (buf.size() > 1) {
      ASSERT_NE(buf.front(), 0x80) << "value " << value;
    }
    ASSERT_EQ(buf.size(), variableLengthSize(value));
  }
}

TEST(MidiStreamTest, VariableLengthSizeBoundaries) {
  EXPECT_EQ(variableLengthSize(0), 1u);
  EXPECT_EQ(variableLengthSize(127), 1u);
  EXPECT_EQ(variableLengthSize(128), 2u);
  EXPECT_EQ(variableLengthSize(16383), 2u);
  EXPECT_EQ(variableLengthSize(16384), 3u);
  EXPECT_EQ(variableLengthSize(2097151), 3u);
  EXPECT_EQ(variableLengthSize(2097152), 4u);
}

TEST(MidiStreamTest, ReadVariableLengthStopsAtBufferEnd) {
  // Continuation bit set on the last available byte.
  std::vector<uint8_t> truncated = {0x81, 0x80};
  size_t offset = 0;
  uint32_t value = readVariableLength(truncated.data(), offset, truncated.size());
  EXPECT_EQ(offset, 2u);
  EXPECT_EQ(value, 128u);
}

TEST(MidiStreamTest, ReadVariableLengthAdvancesOffset) {
  std::vector<uint8_t> data = {0x30, 0x82, 0x50, 0x00};
  size_t offset = 0;
  EXPECT_EQ(readVariableLength(data.data(), offset, data.size()), 48u);
  EXPECT_EQ(offset, 1u);
  EXPECT_EQ(readVariableLength(data.data(), offset, data.size()), 336u);
  EXPECT_EQ(offset, 3u);
  EXPECT_EQ(readVariableLength(data.data(), offset, data.size()), 0u);
  EXPECT_EQ(offset, 4u);
}

// ---------------------------------------------------------------------------
// Big-endian helpers
// ---------------------------------------------------------------------------

TEST(MidiStreamTest, WriteBigEndian) {
  std::vector<uint8_t> buf;
  writeBE16(buf, 0x0060);
  writeBE24(buf, 0x07A120);
  writeBE32(buf, 0x00000006);
  EXPECT_EQ(buf, (std::vector<uint8_t>{0x00, 0x60, 0x07, 0xA1, 0x20, 0x00, 0x00, 0x00, 0x06}));
}

TEST(MidiStreamTest, WriteBE24IgnoresHighByte) {
  std::vector<uint8_t> buf;
  writeBE24(buf, 0xAB123456);
  EXPECT_EQ(buf, (std::vector<uint8_t>{0x12, 0x34, 0x56}));
}

TEST(MidiStreamTest, ReadBigEndian) {
  const uint8_t data[] = {0x12, 0x34, 0x56, 0x78, 0x9A};
  EXPECT_EQ(readBE16(data, 0), 0x1234u);
  EXPECT_EQ(readBE16(data, 3), 0x789Au);
  EXPECT_EQ(readBE24(data, 1), 0x345678u);
  EXPECT_EQ(readBE32(data, 0), 0x12345678u);
  EXPECT_EQ(readBE32(data, 1), 0x3456789Au);
}

// ---------------------------------------------------------------------------
// Tempo
// ---------------------------------------------------------------------------

TEST(MidiStreamTest, TempoFromBpm) {
  EXPECT_EQ(tempoFromBpm(120), 500000u);
  EXPECT_EQ(tempoFromBpm(60), 1000000u);
  EXPECT_EQ(tempoFromBpm(1), 60000000u);
  EXPECT_EQ(tempoFromBpm(0), 0u);
}

TEST(MidiStreamTest, TempoFromBpmTruncates) {
  // 60,000,000 / 7 = 8,571,428.57...
  EXPECT_EQ(tempoFromBpm(7), 8571428u);
  // 60,000,000 / 70 = 857,142.857...
  EXPECT_EQ(tempoFromBpm(70), 857142u);
  EXPECT_EQ(tempoFromBpm(kMicrosecondsPerMinute + 1), 0u);
}

TEST(MidiStreamTest, TempoEncodableRange) {
  EXPECT_FALSE(isTempoEncodable(0));
  EXPECT_FALSE(isTempoEncodable(1));
  EXPECT_FALSE(isTempoEncodable(3));  // 20,000,000 > 0xFFFFFF
  EXPECT_TRUE(isTempoEncodable(4));   // 15,000,000
  EXPECT_TRUE(isTempoEncodable(120));
  EXPECT_TRUE(isTempoEncodable(kMicrosecondsPerMinute));
  EXPECT_FALSE(isTempoEncodable(kMicrosecondsPerMinute + 1));
}

}  // namespace
}  // namespace morse
