// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "action.hh"

#include "pointer.hh"

namespace drops::ui {

Action::Action(Pointer& pointer) : pointer(pointer) {}

Action::~Action() {}

TapAction::TapAction(Pointer& pointer, const Fn<void()>& on_tap) : Action(pointer) {
  if (on_tap) {
    on_tap();
  }
}

}  // namespace drops::ui
