// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_text.hh"

#include "gtest.hh"

using namespace drops;
using namespace drops::ui;
using namespace testing;

// One unit per code point.
static float CountCodePoints(StrView s) {
  float n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

TEST(WrapTextTest, GreedyWordWrap) {
  EXPECT_THAT(WrapText("aaa bbb ccc", CountCodePoints, 0, 7), ElementsAre("aaa bbb", "ccc"));
  EXPECT_THAT(WrapText("aaa bbb ccc", CountCodePoints, 0, 100), ElementsAre("aaa bbb ccc"));
  EXPECT_THAT(WrapText("a  b", CountCodePoints, 0, 100), ElementsAre("a b"));
}

TEST(WrapTextTest, LongWordsAreCut) {
  EXPECT_THAT(WrapText("abcdefghij", CountCodePoints, 1, 5), ElementsAre("abcd…"));
  EXPECT_THAT(WrapText("abcdefghij xy", CountCodePoints, 0, 3), ElementsAre("ab…", "xy"));
  EXPECT_THAT(WrapText("xy abcdefghij", CountCodePoints, 2, 4), ElementsAre("xy", "abc…"));
  EXPECT_THAT(WrapText("https://example.com/żółw", CountCodePoints, 1, 22),
              ElementsAre("https://example.com/ż…"));
}

TEST(WrapTextTest, NewLines) {
  EXPECT_THAT(WrapText("a\nb", CountCodePoints, 0, 100), ElementsAre("a", "b"));
  EXPECT_THAT(WrapText("a\n\nb", CountCodePoints, 0, 100), ElementsAre("a", "", "b"));
  EXPECT_THAT(WrapText("", CountCodePoints, 0, 100), ElementsAre(""));
}

TEST(WrapTextTest, TruncatesWithEllipsis) {
  EXPECT_THAT(WrapText("aaa bbb ccc", CountCodePoints, 1, 7), ElementsAre("aaa bb…"));
  EXPECT_THAT(WrapText("aaa bbb ccc ddd", CountCodePoints, 2, 7), ElementsAre("aaa bbb", "ccc dd…"));
  // Trailing spaces are removed before the ellipsis.
  EXPECT_THAT(WrapText("aaaaa b\nc", CountCodePoints, 1, 7), ElementsAre("aaaaa…"));
  // Lines that fit are not touched.
  EXPECT_THAT(WrapText("aaa bbb", CountCodePoints, 1, 7), ElementsAre("aaa bbb"));
}

TEST(WrapTextTest, TruncationRespectsMultibyteCharacters) {
  auto lines = WrapText("żółw żółw", CountCodePoints, 1, 6);
  EXPECT_THAT(lines, ElementsAre("żółw…"));
}

TEST(MeasureTextTest, EmptyTextHasNoSize) {
  EXPECT_EQ(MeasureText("", SkFont(nullptr, 12), 0, 100), Vec2(0, 0));
}

TEST(LabelTest, NegativeLineCountMeansUnlimited) {
  Label label(nullptr, "x", SkFont(nullptr, 12), SK_ColorBLACK, -3);
  EXPECT_EQ(label.number_of_lines, 0);
}

TEST(LabelTest, PreferredSizeUsesMeasure) {
  int calls = 0;
  int seen_lines = -1;
  float seen_width = -1;
  Label label(nullptr, "Hello", SkFont(nullptr, 12), SK_ColorWHITE, 2,
              [&](StrView text, const SkFont&, int max_lines, float max_width) {
                ++calls;
                seen_lines = max_lines;
                seen_width = max_width;
                return Vec2(text.size() * 5.f, 12);
              });
  EXPECT_EQ(label.PreferredSize(80), Vec2(25, 12));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen_lines, 2);
  EXPECT_EQ(seen_width, 80);
  EXPECT_EQ(label.paint.getColor(), SK_ColorWHITE);
}

TEST(LabelTest, LinesAreWrappedWithMeasure) {
  // Two units per byte.
  TextMeasureFn measure = [](StrView text, const SkFont&, int, float) {
    return Vec2(text.size() * 2.f, 10);
  };
  Label label(nullptr, "aaa bbb ccc", SkFont(nullptr, 12), SK_ColorWHITE, 0, measure);
  label.Resize(Vec2(14, 30));
  EXPECT_THAT(label.Lines(), ElementsAre("aaa bbb", "ccc"));

  label.number_of_lines = 1;
  label.text = "/a/very/long/path";
  label.Resize(Vec2(20, 10));
  auto lines = label.Lines();
  ASSERT_THAT(lines, SizeIs(1));
  EXPECT_THAT(lines[0], EndsWith("…"));
  EXPECT_LE(lines[0].size() * 2.f, label.size.width);
}
