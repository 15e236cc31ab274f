// Implementation of Morse symbol conversions and per-symbol timing.

#include "core/basic_types.h"

namespace morse {

bool morseSymbolFromChar(char chr, MorseSymbol& symbol) {
  switch (chr) {
    case '.': symbol = MorseSymbol::Dot;       return true;
    case '-': symbol = MorseSymbol::Dash;      return true;
    case ' ': symbol = MorseSymbol::LetterGap; return true;
    case '/': symbol = MorseSymbol::WordGap;   return true;
    default: break;
  }
  return false;
}

const char* morseSymbolToString(MorseSymbol symbol) {
  switch (symbol) {
    case MorseSymbol::Dot:       return "Dot";
    case MorseSymbol::Dash:      return "Dash";
    case MorseSymbol::LetterGap: return "LetterGap";
    case MorseSymbol::WordGap:   return "WordGap";
  }
  return "Unknown";
}

Tick noteDurationFor(MorseSymbol symbol) {
  switch (symbol) {
    case MorseSymbol::Dot:  return timing::kDot;
    case MorseSymbol::Dash: return timing::kDash;
    case MorseSymbol::LetterGap:
    case MorseSymbol::WordGap:
      break;
  }
  return 0;
}

Tick gapAfter(MorseSymbol symbol) {
  switch (symbol) {
    case MorseSymbol::Dot:
    case MorseSymbol::Dash:      return timing::kDot;
    case MorseSymbol::LetterGap: return timing::kLetterGap;
    case MorseSymbol::WordGap:   return timing::kPause;
  }
  return 0;
}

}  // namespace morse
