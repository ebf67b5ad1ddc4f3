// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_button.hh"

#include <algorithm>

#include "action.hh"
#include "pointer.hh"

using namespace std;

namespace drops::ui {

Button::Button(Widget* parent, ButtonArgs args)
    : Widget(parent), on_click(std::move(args.on_click)) {}

void Button::FillChildren(Vec<Widget*>& children) {
  if (child) {
    children.push_back(child.get());
  }
}

Vec2 Button::PreferredSize(float max_width) const {
  Vec2 content = child ? child->PreferredSize(max(0.f, max_width - 2 * kPadding)) : Vec2();
  return content + Vec2(2 * kPadding, 2 * kPadding);
}

void Button::SizeChanged() {
  corner_radius = PillRadius(size);
  UpdateChildTransform();
}

void Button::UpdateChildTransform() {
  if (child == nullptr) {
    return;
  }
  Vec2 content = child->PreferredSize(max(0.f, size.width - 2 * kPadding));
  content.width = min(content.width, max(0.f, size.width - 2 * kPadding));
  content.height = min(content.height, max(0.f, size.height - 2 * kPadding));
  Vec2 origin = (size - content) / 2;
  child->SetFrame(Rect::MakeOriginSize(origin, content));
}

SkRRect Button::RRect() const {
  return SkRRect::MakeRectXY(Bounds().sk, corner_radius, corner_radius);
}

SkPath Button::Shape() const { return SkPath::RRect(RRect()); }

void Button::Activate() {
  // Copy because the callback may destroy this button.
  auto callback = on_click;
  if (callback) {
    callback();
  }
}

struct ButtonAction : Action {
  ButtonAction(Pointer& pointer, Button& button) : Action(pointer) {
    button.Activate();  // This may destroy the button.
  }

  void Update() override {}
};

std::unique_ptr<Action> Button::FindAction(Pointer& pointer, PointerButton btn) {
  if (btn == PointerButton::Left) {
    return std::make_unique<ButtonAction>(pointer, *this);
  }
  return nullptr;
}

}  // namespace drops::ui
