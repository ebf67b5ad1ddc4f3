// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "pointer.hh"

#include "gtest.hh"
#include "log.hh"

using namespace drops;
using namespace drops::ui;
using namespace testing;

namespace {

struct CountingAction : Action {
  int& updates;
  CountingAction(Pointer& pointer, int& presses, int& updates) : Action(pointer), updates(updates) {
    ++presses;
  }
  void Update() override { ++updates; }
};

struct Panel : Widget {
  Vec<std::unique_ptr<Widget>> children;
  bool clickable = false;
  bool block_children = false;
  int presses = 0;
  int updates = 0;

  Panel(Widget* parent, Rect frame) : Widget(parent) { SetFrame(frame); }

  Panel& AddPanel(Rect frame) {
    children.push_back(std::make_unique<Panel>(this, frame));
    return static_cast<Panel&>(*children.back());
  }

  void FillChildren(Vec<Widget*>& out) override {
    for (auto& c : children) out.push_back(c.get());
  }
  bool AllowChildPointerEvents(Widget&) const override { return !block_children; }
  std::unique_ptr<Action> FindAction(Pointer& p, PointerButton btn) override {
    if (!clickable || btn != PointerButton::Left) return nullptr;
    return std::make_unique<CountingAction>(p, presses, updates);
  }
};

}  // namespace

TEST(PointerTest, PathFollowsShapes) {
  Panel root(nullptr, Rect::MakeXYWH(0, 0, 100, 100));
  Panel& a = root.AddPanel(Rect::MakeXYWH(10, 10, 30, 30));
  Panel& b = a.AddPanel(Rect::MakeXYWH(5, 5, 10, 10));

  Pointer pointer(root, Vec2(17, 17));
  EXPECT_EQ(pointer.GetWidget(), &b);
  EXPECT_THAT(pointer.path, ElementsAre(&root, &a, &b));
  EXPECT_EQ(pointer.PositionWithin(b), Vec2(2, 2));

  pointer.Move(Vec2(50, 50));
  EXPECT_EQ(pointer.GetWidget(), &root);

  pointer.Move(Vec2(150, 50));
  EXPECT_EQ(pointer.GetWidget(), nullptr);
}

TEST(PointerTest, PressBubblesUpToTheFirstClickableWidget) {
  Panel root(nullptr, Rect::MakeXYWH(0, 0, 100, 100));
  Panel& a = root.AddPanel(Rect::MakeXYWH(10, 10, 30, 30));
  Panel& b = a.AddPanel(Rect::MakeXYWH(5, 5, 10, 10));
  root.clickable = true;
  a.clickable = true;

  Pointer pointer(root, Vec2(17, 17));
  pointer.ButtonDown(PointerButton::Left);
  EXPECT_EQ(a.presses, 1);
  EXPECT_EQ(root.presses, 0);
  EXPECT_EQ(b.presses, 0);
  EXPECT_TRUE(pointer.IsPressed(PointerButton::Left));

  pointer.Move(Vec2(20, 20));
  EXPECT_EQ(a.updates, 1);

  pointer.ButtonUp(PointerButton::Left);
  EXPECT_FALSE(pointer.IsPressed(PointerButton::Left));

  pointer.Move(Vec2(80, 80));
  pointer.Click();
  EXPECT_EQ(root.presses, 1);
}

TEST(PointerTest, BlockedChildrenDontReceivePresses) {
  Panel root(nullptr, Rect::MakeXYWH(0, 0, 100, 100));
  Panel& a = root.AddPanel(Rect::MakeXYWH(10, 10, 30, 30));
  root.clickable = true;
  a.clickable = true;
  root.block_children = true;

  Pointer pointer(root, Vec2(20, 20));
  EXPECT_EQ(pointer.GetWidget(), &root);
  pointer.Click();
  EXPECT_EQ(root.presses, 1);
  EXPECT_EQ(a.presses, 0);
}

TEST(PointerTest, DoublePressIsAnError) {
  Panel root(nullptr, Rect::MakeXYWH(0, 0, 100, 100));
  root.clickable = true;
  Vec<Str> errors;
  ClearLoggers();
  AddLogger([&](const LogEntry& e) {
    if (e.log_level == LogLevel::Error) errors.push_back(e.buffer);
  });
  Pointer pointer(root, Vec2(50, 50));
  pointer.ButtonDown(PointerButton::Left);
  pointer.ButtonDown(PointerButton::Left);
  RestoreDefaultLoggers();
  EXPECT_EQ(root.presses, 1);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_THAT(errors[0], HasSubstr("pressed twice"));
}

TEST(PointerTest, ToStr) {
  Panel root(nullptr, Rect::MakeXYWH(0, 0, 10, 10));
  Pointer pointer(root, Vec2(1.5, 2));
  EXPECT_EQ(pointer.ToStr(), "Pointer(1.5, 2)");
}
