// Helper for reading/writing binary MIDI data (variable-length quantities,
// big-endian integers, tempo values).

#ifndef MORSE_MIDI_MIDI_STREAM_H
#define MORSE_MIDI_MIDI_STREAM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace morse {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value a VLQ may carry (4 encoded bytes).
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// Longest VLQ encoding in bytes.
constexpr size_t kMaxVariableLengthBytes = 4;

/// Largest value the 3-byte tempo meta-event payload can hold.
constexpr uint32_t kMaxTempoMicroseconds = 0xFFFFFF;

// Status and meta-event type bytes used by Morse tracks (channel 0 only).
constexpr uint8_t kNoteOn = 0x90;
constexpr uint8_t kNoteOff = 0x80;
constexpr uint8_t kMetaEvent = 0xFF;
constexpr uint8_t kMetaSetTempo = 0x51;
constexpr uint8_t kMetaEndOfTrack = 0x2F;

/// @brief Write a variable-length quantity (VLQ) to a byte buffer.
/// @param buf Destination buffer (bytes are appended).
/// @param value The unsigned value to encode (max kMaxVariableLength).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Encode a variable-length quantity into a fresh buffer.
/// @param value The unsigned value to encode (max kMaxVariableLength).
/// @return Encoded bytes, most significant group first.
std::vector<uint8_t> encodeVariableLength(uint32_t value);

/// @brief Number of bytes writeVariableLength() emits for a value.
/// @return 1 to 4.
size_t variableLengthSize(uint32_t value);

/// @brief Read a variable-length quantity from raw MIDI data.
/// @param data Pointer to the raw byte stream.
/// @param offset Current read position; advanced past the VLQ on return.
/// @param max_size Total size of the data buffer (bounds check).
/// @return Decoded unsigned value (partial if the data ends early).
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

/// @brief Write a big-endian uint16 to a byte buffer.
/// @param buf Destination buffer (2 bytes appended).
/// @param value The 16-bit value.
void writeBE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Write a big-endian 24-bit value to a byte buffer.
/// @param buf Destination buffer (3 bytes appended).
/// @param value Value whose low 24 bits are written.
void writeBE24(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Write a big-endian uint32 to a byte buffer.
/// @param buf Destination buffer (4 bytes appended).
/// @param value The 32-bit value.
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a big-endian uint16 from raw data at a given offset.
/// @param data Pointer to the raw byte stream.
/// @param offset Byte position to read from.
/// @return Decoded 16-bit value.
uint16_t readBE16(const uint8_t* data, size_t offset);

/// @brief Read a big-endian 24-bit value from raw data at a given offset.
uint32_t readBE24(const uint8_t* data, size_t offset);

/// @brief Read a big-endian uint32 from raw data at a given offset.
/// @param data Pointer to the raw byte stream.
/// @param offset Byte position to read from.
/// @return Decoded 32-bit value.
uint32_t readBE32(const uint8_t* data, size_t offset);

/// @brief Microseconds per quarter note for a BPM, truncating.
/// @param bpm Beats per minute, must be > 0.
/// @return 60,000,000 / bpm (integer division).
uint32_t tempoFromBpm(uint32_t bpm);

/// @brief Check that a BPM yields a tempo in [1, kMaxTempoMicroseconds].
bool isTempoEncodable(uint32_t bpm);

}  // namespace morse

#endif  // MORSE_MIDI_MIDI_STREAM_H
