// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include "fn.hh"

namespace drops::ui {

struct Pointer;

// Action represents a gesture that the user performs by pressing a pointer button and then
// (optionally) moving the pointer around before releasing it.
//
// Actions are the main mechanism for the user to interact with the UI.
struct Action {
  Pointer& pointer;

  // Each action must be bound to a pointer. A reference to the pointer is stored internally to keep
  // track of its position.
  Action(Pointer& pointer);

  // Action is destroyed when the pointer button is released.
  virtual ~Action();

  // Update is called when the pointer moves (although spurious calls are also possible).
  virtual void Update() = 0;
};

// Calls the given function once, when the button goes down. Doesn't keep any reference to the
// widget that created it, so the callback is free to destroy that widget.
struct TapAction : Action {
  TapAction(Pointer& pointer, const Fn<void()>& on_tap);
  void Update() override {}
};

}  // namespace drops::ui
