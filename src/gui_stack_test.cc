// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_stack.hh"

#include "gtest.hh"

using namespace drops;
using namespace drops::ui;
using namespace testing;

namespace {

// Widget that always wants the same size.
struct Box : Widget {
  Vec2 preferred;
  Box(Widget* parent, Vec2 preferred) : Widget(parent), preferred(preferred) {}
  Vec2 PreferredSize(float max_width) const override { return preferred; }
};

// Widget that fills the available width with lines 10 units tall, 100 units of content per line.
struct Paragraph : Widget {
  Paragraph(Widget* parent) : Widget(parent) {}
  Vec2 PreferredSize(float max_width) const override {
    if (max_width >= 100) return Vec2(100, 10);
    return Vec2(max_width, max_width >= 50 ? 20 : 40);
  }
};

}  // namespace

TEST(StackTest, HorizontalCentered) {
  Stack stack(nullptr, Axis::Horizontal, Alignment::Center, 2);
  auto& a = stack.Add<Box>(Vec2(10, 10));
  auto& b = stack.Add<Box>(Vec2(20, 30));
  auto& c = stack.Add<Box>(Vec2(6, 6));
  stack.Resize(Vec2(100, 40));
  EXPECT_EQ(a.Frame(), Rect::MakeXYWH(0, 15, 10, 10));
  EXPECT_EQ(b.Frame(), Rect::MakeXYWH(12, 5, 20, 30));
  EXPECT_EQ(c.Frame(), Rect::MakeXYWH(34, 17, 6, 6));
  EXPECT_THAT(stack.Arranged(), ElementsAre(&a, &b, &c));
  EXPECT_EQ(stack.Children(), stack.Arranged());
}

TEST(StackTest, FlexibleChildTakesTheRest) {
  Stack stack(nullptr, Axis::Horizontal, Alignment::Center, 10);
  auto& icon = stack.Add<Box>(Vec2(16, 16));
  auto& text = stack.Add<Paragraph>();
  auto& button = stack.Add<Box>(Vec2(40, 30));
  stack.flexible = &text;
  stack.Resize(Vec2(200, 30));
  EXPECT_EQ(icon.Frame().left, 0);
  EXPECT_EQ(text.Frame(), Rect::MakeXYWH(26, 10, 124, 10));
  EXPECT_EQ(button.Frame(), Rect::MakeXYWH(160, 0, 40, 30));

  // Less space makes the paragraph wrap.
  stack.Resize(Vec2(130, 40));
  EXPECT_EQ(text.size, Vec2(54, 20));
  EXPECT_EQ(button.Frame().right, 130);
}

TEST(StackTest, NegativeSpacing) {
  Stack stack(nullptr, Axis::Vertical, Alignment::Fill, -1);
  auto& a = stack.Add<Box>(Vec2(10, 14));
  auto& b = stack.Add<Box>(Vec2(20, 14));
  stack.Resize(stack.PreferredSize(100));
  EXPECT_EQ(stack.size, Vec2(20, 27));
  EXPECT_EQ(a.Frame(), Rect::MakeXYWH(0, 0, 20, 14));
  EXPECT_EQ(b.Frame(), Rect::MakeXYWH(0, 13, 20, 14));
}

TEST(StackTest, FixedConstraintsOverridePreferredSize) {
  Stack stack(nullptr, Axis::Horizontal, Alignment::Center, 0);
  auto& icon = stack.Add<Box>(Vec2(32, 32));
  Vec<Constraint> constraints = {
      Constraint::Fixed(icon, Anchor::Width, 16),
      Constraint::Fixed(icon, Anchor::Height, 16),
  };
  stack.constraints = constraints;
  EXPECT_EQ(stack.PreferredSize(100), Vec2(16, 16));
  stack.Resize(Vec2(50, 20));
  EXPECT_EQ(icon.Frame(), Rect::MakeXYWH(0, 2, 16, 16));
}

TEST(StackTest, PreferredSize) {
  Stack row(nullptr, Axis::Horizontal, Alignment::Center, 10);
  row.Add<Box>(Vec2(16, 16));
  auto& text = row.Add<Paragraph>();
  row.flexible = &text;
  EXPECT_EQ(row.PreferredSize(500), Vec2(126, 16));
  EXPECT_EQ(row.PreferredSize(76), Vec2(76, 20));

  Stack empty(nullptr, Axis::Vertical, Alignment::Fill, 5);
  EXPECT_EQ(empty.PreferredSize(100), Vec2(0, 0));
}

TEST(StackTest, OriginsAreSnappedToPixels) {
  Stack stack(nullptr, Axis::Horizontal, Alignment::Center, 0);
  auto& a = stack.Add<Box>(Vec2(10, 10));
  stack.Resize(Vec2(10, 11));
  EXPECT_EQ(a.Frame().top, 1);  // 0.5 rounded
  stack.pixel_scale = 2;
  stack.Layout();
  EXPECT_EQ(a.Frame().top, 0.5);
}
