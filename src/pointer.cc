// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "pointer.hh"

#include "format.hh"
#include "log.hh"

using namespace std;

namespace drops::ui {

Pointer::Pointer(Widget& root, Vec2 position) : root(root), pointer_position(position) {}

Pointer::~Pointer() {
  for (auto& action : actions) {
    action.reset();
  }
}

static bool FillPath(Pointer& p, Widget& w) {
  p.path.emplace_back(&w);
  Vec2 point = TransformDown(w).mapPoint(p.pointer_position);

  bool p_inside_w = w.Shape().contains(point.x, point.y);

  if (p_inside_w) {
    for (auto* child : w.Children()) {
      if (w.AllowChildPointerEvents(*child)) {
        if (FillPath(p, *child)) {
          return true;
        }
      }
    }
    // All of the parent stack frames are short-circuited by `return true`.
    return true;
  }

  p.path.pop_back();
  return false;
}

void Pointer::UpdatePath() {
  path.clear();
  FillPath(*this, root);
}

void Pointer::Move(Vec2 position) {
  pointer_position = position;
  UpdatePath();
  for (auto& action : actions) {
    if (action) {
      action->Update();
    }
  }
}

void Pointer::ButtonDown(PointerButton btn) {
  if (btn == PointerButton::Unknown || btn >= PointerButton::Count) return;
  auto& action = actions[static_cast<int>(btn)];
  if (action) {
    ERROR << "Pointer button pressed twice without release at " << pointer_position;
    return;
  }

  UpdatePath();

  // Copy the path because actions may run callbacks that destroy the widgets (and change the
  // path).
  Vec<Widget*> candidates = path;
  path.clear();
  for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
    action = (*it)->FindAction(*this, btn);
    if (action) {
      break;
    }
  }
}

void Pointer::ButtonUp(PointerButton btn) {
  if (btn == PointerButton::Unknown || btn >= PointerButton::Count) return;
  actions[static_cast<int>(btn)].reset();
}

void Pointer::Click(PointerButton btn) {
  ButtonDown(btn);
  ButtonUp(btn);
}

Widget* Pointer::GetWidget() {
  UpdatePath();
  if (path.empty()) {
    return nullptr;
  }
  return path.back();
}

Vec2 Pointer::PositionWithin(const Widget& widget) const {
  return TransformDown(widget).mapPoint(pointer_position);
}

bool Pointer::IsPressed(PointerButton btn) const {
  if (btn == PointerButton::Unknown || btn >= PointerButton::Count) return false;
  return actions[static_cast<int>(btn)] != nullptr;
}

Str Pointer::ToStr() const { return f("Pointer({}, {})", pointer_position.x, pointer_position.y); }

}  // namespace drops::ui
