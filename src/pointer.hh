// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <memory>

#include "action.hh"
#include "math.hh"
#include "str.hh"
#include "vec.hh"
#include "widget.hh"

namespace drops::ui {

// Feeds presses of a single pointing device (mouse, finger) into a widget tree.
//
// The position is expressed in the coordinates of the topmost ancestor of `root` (the space in
// which the presenter places its widgets).
struct Pointer {
  Pointer(Widget& root, Vec2 position);
  ~Pointer();

  void Move(Vec2 position);
  void ButtonDown(PointerButton);
  void ButtonUp(PointerButton);

  // Press & release in one go.
  void Click(PointerButton = PointerButton::Left);

  // The innermost widget under the pointer (or nullptr if the pointer is outside of `root`).
  Widget* GetWidget();

  Vec2 PositionWithin(const Widget&) const;

  // Whether any action is currently held by the given button.
  bool IsPressed(PointerButton) const;

  Str ToStr() const;

  Widget& root;
  Vec2 pointer_position;

  std::unique_ptr<Action> actions[static_cast<int>(PointerButton::Count)];

  // Widgets under the pointer, from `root` to the innermost one. Recomputed on every event.
  Vec<Widget*> path;

  void UpdatePath();
};

}  // namespace drops::ui
