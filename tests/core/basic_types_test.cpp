// Tests for core/basic_types.h -- timing unit, symbol conversions.

#include "core/basic_types.h"

#include <gtest/gtest.h>

#include <string>

namespace morse {
namespace {

// ---------------------------------------------------------------------------
// Timing constants
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, TimingConstants) {
  EXPECT_EQ(kTicksPerBeat, 96u);
  EXPECT_EQ(timing::kDot, 48u);
  EXPECT_EQ(timing::kDash, 144u);
  EXPECT_EQ(timing::kLetterGap, 192u);
  EXPECT_EQ(timing::kPause, 336u);
}

TEST(BasicTypesTest, TimingRatiosHold) {
  EXPECT_EQ(timing::kDot * 2, kTicksPerBeat);
  EXPECT_EQ(timing::kDash, 3 * timing::kDot);
  EXPECT_EQ(timing::kLetterGap, 4 * timing::kDot);
  EXPECT_EQ(timing::kPause, 7 * timing::kDot);
}

TEST(BasicTypesTest, NoteAndTempoConstants) {
  EXPECT_EQ(kMorseNote, 76u);
  EXPECT_EQ(kMorseVelocity, 100u);
  EXPECT_EQ(kDefaultBpm, 120u);
  EXPECT_EQ(kMinBpm, 4u);
  EXPECT_EQ(kMaxBpm, 60000000u);
}

// ---------------------------------------------------------------------------
// MorseSymbol conversions
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, MorseSymbolFromChar) {
  MorseSymbol symbol = MorseSymbol::WordGap;
  ASSERT_TRUE(morseSymbolFromChar('.', symbol));
  EXPECT_EQ(symbol, MorseSymbol::Dot);
  ASSERT_TRUE(morseSymbolFromChar('-', symbol));
  EXPECT_EQ(symbol, MorseSymbol::Dash);
  ASSERT_TRUE(morseSymbolFromChar(' ', symbol));
  EXPECT_EQ(symbol, MorseSymbol::LetterGap);
  ASSERT_TRUE(morseSymbolFromChar('/', symbol));
  EXPECT_EQ(symbol, MorseSymbol::WordGap);
}

TEST(BasicTypesTest, MorseSymbolFromCharRejectsOthers) {
  MorseSymbol symbol = MorseSymbol::Dot;
  EXPECT_FALSE(morseSymbolFromChar('a', symbol));
  EXPECT_FALSE(morseSymbolFromChar('_', symbol));
  EXPECT_FALSE(morseSymbolFromChar('\t', symbol));
  EXPECT_EQ(symbol, MorseSymbol::Dot) << "Failed conversion must not touch the output";
}

TEST(BasicTypesTest, MorseSymbolToChar) {
  EXPECT_EQ(morseSymbolToChar(MorseSymbol::Dot), '.');
  EXPECT_EQ(morseSymbolToChar(MorseSymbol::Dash), '-');
  EXPECT_EQ(morseSymbolToChar(MorseSymbol::LetterGap), ' ');
  EXPECT_EQ(morseSymbolToChar(MorseSymbol::WordGap), '/');
}

TEST(BasicTypesTest, IsMorseSymbolChar) {
  for (char chr : std::string(".- /")) {
    EXPECT_TRUE(isMorseSymbolChar(chr)) << "char '" << chr << "'";
  }
  for (char chr : std::string("a0_|\n")) {
    EXPECT_FALSE(isMorseSymbolChar(chr)) << "char '" << chr << "'";
  }
}

TEST(BasicTypesTest, MorseSymbolToString) {
  EXPECT_STREQ(morseSymbolToString(MorseSymbol::Dot), "Dot");
  EXPECT_STREQ(morseSymbolToString(MorseSymbol::Dash), "Dash");
  EXPECT_STREQ(morseSymbolToString(MorseSymbol::LetterGap), "LetterGap");
  EXPECT_STREQ(morseSymbolToString(MorseSymbol::WordGap), "WordGap");
}

// ---------------------------------------------------------------------------
// Per-symbol timing
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, NoteDurationFor) {
  EXPECT_EQ(noteDurationFor(MorseSymbol::Dot), timing::kDot);
  EXPECT_EQ(noteDurationFor(MorseSymbol::Dash), timing::kDash);
  EXPECT_EQ(noteDurationFor(MorseSymbol::LetterGap), 0u);
  EXPECT_EQ(noteDurationFor(MorseSymbol::WordGap), 0u);
}

TEST(BasicTypesTest, GapAfter) {
  EXPECT_EQ(gapAfter(MorseSymbol::Dot), timing::kDot);
  EXPECT_EQ(gapAfter(MorseSymbol::Dash), timing::kDot);
  EXPECT_EQ(gapAfter(MorseSymbol::LetterGap), timing::kLetterGap);
  EXPECT_EQ(gapAfter(MorseSymbol::WordGap), timing::kPause);
}

}  // namespace
}  // namespace morse
