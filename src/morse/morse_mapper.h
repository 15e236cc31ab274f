// Text to Morse symbol stream conversion.

#ifndef MORSE_MORSE_MORSE_MAPPER_H
#define MORSE_MORSE_MORSE_MAPPER_H

#include <cstddef>
#include <string>

namespace morse {

/// @brief Convert free text into a Morse symbol stream.
///
/// The text is lowercased and split on the literal space character. Within a
/// word, letter codes are joined by a single ' '. Words are joined by '/'.
/// Characters without a code (digits, punctuation, non-ASCII bytes) are
/// dropped. Consecutive spaces produce empty words, so "a  b" maps to
/// ".-//-...".
///
/// @param text Input text, any case.
/// @return Stream containing only '.', '-', ' ' and '/'.
std::string textToMorse(const std::string& text);

/// @brief Convert a single word (no spaces) into space-joined letter codes.
/// @param word Word to convert, any case.
/// @return Codes joined by ' ', or an empty string if nothing maps.
std::string wordToMorse(const std::string& word);

/// @brief Lowercase ASCII letters, leaving every other byte untouched.
std::string toLowerAscii(const std::string& text);

/// @brief Check whether every byte of a string is a Morse stream symbol.
bool isMorseStream(const std::string& morse);

/// @brief Count the note symbols (dots and dashes) in a Morse stream.
/// @return Number of note-on/note-off pairs the stream will produce.
size_t countMorseNotes(const std::string& morse);

}  // namespace morse

#endif  // MORSE_MORSE_MORSE_MAPPER_H
