/// @file
/// @brief Static letter-to-code lookup (ITU Morse, letters only).

#include "morse/morse_table.h"

namespace morse {

/// @brief Morse codes indexed by letter offset from 'a'.
static constexpr const char* kLetterCodes[kMorseLetterCount] = {
    ".-",    // a
    "-...",  // b
    "-.-.",  // c
    "-..",   // d
    ".",     // e
    "..-.",  // f
    "--.",   // g
    "....",  // h
    "..",    // i
    ".---",  // j
    "-.-",   // k
    ".-..",  // l
    "--",    // m
    "-.",    // n
    "---",   // o
    ".--.",  // p
    "--.-",  // q
    ".-.",   // r
    "...",   // s
    "-",     // t
    "..-",   // u
    "...-",  // v
    ".--",   // w
    "-..-",  // x
    "-.--",  // y
    "--.."   // z
};

const char* lookupMorseCode(char chr) {
  if (chr < 'a' || chr > 'z') {
    return nullptr;
  }
  return kLetterCodes[chr - 'a'];
}

}  // namespace morse
