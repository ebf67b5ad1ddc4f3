// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkRRect.h>

#include <memory>

#include "fn.hh"
#include "widget.hh"

namespace drops::ui {

struct ButtonArgs {
  Fn<void()> on_click = nullptr;
};

// Clickable widget that sizes itself to its child plus a fixed padding. Its corners are rounded
// with half of the shorter side, so the button is always a pill or a circle.
struct Button : Widget {
  constexpr static float kPadding = 7.5f;

  std::unique_ptr<Widget> child;
  Fn<void()> on_click;
  float corner_radius = 0;

  Button(Widget* parent, ButtonArgs args = {});

  template <typename T, typename... Args>
  T& SetChild(Args&&... args) {
    auto new_child = std::make_unique<T>(this, std::forward<Args>(args)...);
    T& ref = *new_child;
    child = std::move(new_child);
    UpdateChildTransform();
    return ref;
  }

  StrView Name() const override { return "Button"; }
  void FillChildren(Vec<Widget*>& children) override;
  Vec2 PreferredSize(float max_width) const override;
  void SizeChanged() override;
  SkRRect RRect() const;
  SkPath Shape() const override;

  virtual void Activate();
  std::unique_ptr<Action> FindAction(Pointer&, PointerButton) override;

  // Centers the child within the button.
  void UpdateChildTransform();

  // We don't want the children to interact with pointer events.
  bool AllowChildPointerEvents(Widget& child) const override { return false; }
};

}  // namespace drops::ui
