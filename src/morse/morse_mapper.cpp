/// @file
/// @brief Text to Morse symbol stream mapping.

#include "morse/morse_mapper.h"

#include "core/basic_types.h"
#include "morse/morse_table.h"

namespace morse {

std::string toLowerAscii(const std::string& text) {
  std::string result = text;
  for (char& chr : result) {
    if (chr >= 'A' && chr <= 'Z') {
      chr = static_cast<char>(chr - 'A' + 'a');
    }
  }
  return result;
}

std::string wordToMorse(const std::string& word) {
  std::string result;
  bool first = true;
  for (char chr : toLowerAscii(word)) {
    const char* code = lookupMorseCode(chr);
    if (code == nullptr) {
      continue;  // Unmapped characters are dropped.
    }
    if (!first) {
      result += morseSymbolToChar(MorseSymbol::LetterGap);
    }
    result += code;
    first = false;
  }
  return result;
}

std::string textToMorse(const std::string& text) {
  std::string lowered = toLowerAscii(text);
  std::string result;
  result.reserve(lowered.size() * 5);

  // Split on ' ' only. Every separator starts a new (possibly empty) word.
  size_t word_start = 0;
  while (true) {
    size_t space_pos = lowered.find(' ', word_start);
    size_t word_end = (space_pos == std::string::npos) ? lowered.size() : space_pos;

    result += wordToMorse(lowered.substr(word_start, word_end - word_start));

    if (space_pos == std::string::npos) {
      break;
    }
    result += morseSymbolToChar(MorseSymbol::WordGap);
    word_start = space_pos + 1;
  }
  return result;
}

bool isMorseStream(const std::string& morse) {
  for (char chr : morse) {
    if (!isMorseSymbolChar(chr)) {
      return false;
    }
  }
  return true;
}

size_t countMorseNotes(const std::string& morse) {
  size_t count = 0;
  for (char chr : morse) {
    if (chr == morseSymbolToChar(MorseSymbol::Dot) ||
        chr == morseSymbolToChar(MorseSymbol::Dash)) {
      ++count;
    }
  }
  return count;
}

}  // namespace morse
