// International Morse code table for the Latin alphabet.

#ifndef MORSE_MORSE_MORSE_TABLE_H
#define MORSE_MORSE_MORSE_TABLE_H

#include <cstdint>

namespace morse {

/// Number of letters covered by the table (a-z).
constexpr uint8_t kMorseLetterCount = 26;

/// @brief Look up the Morse code for a lowercase letter.
/// @param chr Character to look up. Only 'a'..'z' are mapped; the caller
///        lowercases first.
/// @return Code string of dots and dashes (static, do not free), or nullptr
///         if the character has no code.
const char* lookupMorseCode(char chr);

}  // namespace morse

#endif  // MORSE_MORSE_MORSE_TABLE_H
