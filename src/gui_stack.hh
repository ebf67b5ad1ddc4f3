// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <memory>

#include "layout.hh"
#include "widget.hh"

namespace drops::ui {

enum class Axis { Horizontal, Vertical };

// How the children are placed across the axis of the stack.
enum class Alignment {
  Center,  // children keep their size and are centered
  Fill,    // children are stretched to the full size of the stack
};

// Arranges its children one after another along an axis.
//
// Children that have fixed size constraints (see `layout.hh`) get exactly that size. The
// `flexible` child (if any) receives whatever space remains along the axis. The other children get
// their preferred size.
struct Stack : Widget {
  Axis axis;
  Alignment alignment;
  float spacing;

  // Arranged children, in order (left to right, or top to bottom).
  Vec<std::unique_ptr<Widget>> arranged;

  // One of the `arranged` children or nullptr.
  Widget* flexible = nullptr;

  // Size constraints of the arranged children. Owned by whoever builds the stack.
  Span<const Constraint> constraints;

  // Pixels per unit. Child origins are snapped to the pixel grid.
  float pixel_scale = 1;

  Stack(Widget* parent, Axis axis, Alignment alignment, float spacing);

  template <typename T, typename... Args>
  T& Add(Args&&... args) {
    auto child = std::make_unique<T>(this, std::forward<Args>(args)...);
    T& ref = *child;
    arranged.push_back(std::move(child));
    return ref;
  }

  Vec<Widget*> Arranged() const;

  // Positions the arranged children within the current size of the stack.
  void Layout();

  void SizeChanged() override { Layout(); }
  Vec2 PreferredSize(float max_width) const override;
  void FillChildren(Vec<Widget*>& children) override;

 private:
  // Size of a child that is not flexible, given the width limit.
  Vec2 ChildSize(const Widget& child, float max_width) const;
  float TotalSpacing() const;
};

}  // namespace drops::ui
