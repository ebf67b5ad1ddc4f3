// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "font.hh"

#include "drop.hh"
#include "gtest.hh"
#include "gui_text.hh"

using namespace drops;
using namespace drops::ui;

TEST(FontTest, FontMgrIsShared) {
  ASSERT_NE(GetFontMgr(), nullptr);
  EXPECT_EQ(GetFontMgr().get(), GetFontMgr().get());
}

TEST(FontTest, DefaultFontUsesDefaultTypeface) {
  SkFont font = DefaultFont();
  EXPECT_EQ(font.getSize(), DropText::kDefaultFontSize);
  if (DefaultTypeface() == nullptr) {
    GTEST_SKIP() << "No fonts in " << kFontDirectory;
  }
  EXPECT_EQ(font.getTypeface(), DefaultTypeface().get());
  EXPECT_EQ(Drop("Hi").title.font.getTypeface(), DefaultTypeface().get());
}

TEST(FontTest, DefaultFontHasVisibleText) {
  if (DefaultTypeface() == nullptr || DefaultTypeface()->countGlyphs() == 0) {
    GTEST_SKIP() << "No fonts in " << kFontDirectory;
  }
  Vec2 size = MeasureText("Copied to clipboard", DefaultFont(), 1, 1000);
  EXPECT_GT(size.width, 0);
  EXPECT_GT(size.height, 0);
}
