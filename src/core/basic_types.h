// Basic types for Morse MIDI encoding

#ifndef MORSE_CORE_BASIC_TYPES_H
#define MORSE_CORE_BASIC_TYPES_H

#include <cstdint>

namespace morse {

/// Tick type for MIDI timing (delta or absolute tick count).
using Tick = uint32_t;

/// Fundamental timing constants.
constexpr Tick kTicksPerBeat = 96;

// ---------------------------------------------------------------------------
// Morse timing unit (based on kTicksPerBeat)
// ---------------------------------------------------------------------------

namespace timing {

constexpr Tick kDot = kTicksPerBeat / 2;  // 48
constexpr Tick kDash = kDot * 3;          // 144
constexpr Tick kLetterGap = kDot * 4;     // 192
constexpr Tick kPause = kDot * 7;         // 336

}  // namespace timing

// ---------------------------------------------------------------------------
// Note and tempo constants
// ---------------------------------------------------------------------------

constexpr uint8_t kMorseNote = 76;       // E5
constexpr uint8_t kMorseVelocity = 100;

constexpr uint32_t kDefaultBpm = 120;

/// Lowest BPM whose tempo (60,000,000 / bpm) fits the 24-bit tempo field.
constexpr uint32_t kMinBpm = 4;

/// Highest BPM that still yields a non-zero tempo.
constexpr uint32_t kMaxBpm = 60000000;

// ---------------------------------------------------------------------------
// Morse symbols
// ---------------------------------------------------------------------------

/// One element of a Morse symbol stream. The underlying char is the
/// character used in the textual stream.
enum class MorseSymbol : char {
  Dot = '.',
  Dash = '-',
  LetterGap = ' ',  ///< Between letters of one word.
  WordGap = '/'     ///< Between words.
};

/// @brief Check whether a character is one of the four Morse stream symbols.
/// @param chr Character to test.
/// @return True for '.', '-', ' ' and '/'.
constexpr bool isMorseSymbolChar(char chr) {
  return chr == '.' || chr == '-' || chr == ' ' || chr == '/';
}

/// @brief Convert a stream character to a MorseSymbol.
/// @param chr Character from a Morse stream.
/// @param symbol Receives the symbol on success.
/// @return False if chr is not a Morse stream character.
bool morseSymbolFromChar(char chr, MorseSymbol& symbol);

/// @brief Convert MorseSymbol to its stream character.
constexpr char morseSymbolToChar(MorseSymbol symbol) {
  return static_cast<char>(symbol);
}

/// @brief Convert MorseSymbol to human-readable string.
const char* morseSymbolToString(MorseSymbol symbol);

/// @brief Duration of the note sounded for a symbol.
/// @return kDot or kDash for note symbols, 0 for gaps.
Tick noteDurationFor(MorseSymbol symbol);

/// @brief Delta-time pending after a symbol has been consumed.
/// @return kDot after a note, kLetterGap after ' ', kPause after '/'.
Tick gapAfter(MorseSymbol symbol);

/// A paired note (note-on + matching note-off) with absolute timing.
struct NoteEvent {
  Tick start_tick = 0;
  Tick duration = 0;
  uint8_t pitch = 0;
  uint8_t velocity = 0;
};

}  // namespace morse

#endif  // MORSE_CORE_BASIC_TYPES_H
