// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include "math.hh"
#include "optional.hh"
#include "str.hh"
#include "vec.hh"

namespace drops::ui {

struct Widget;

struct Insets {
  float top = 0, left = 0, bottom = 0, right = 0;

  constexpr float Horizontal() const { return left + right; }
  constexpr float Vertical() const { return top + bottom; }
};

enum class Anchor { Leading, Top, Trailing, Bottom, Width, Height };

StrView ToStr(Anchor);

constexpr bool IsDimension(Anchor anchor) {
  return anchor == Anchor::Width || anchor == Anchor::Height;
}

// Declarative relation between one anchor of a widget and either a constant or an anchor of
// another widget:
//
//   item.anchor == constant                       (when `target` is null)
//   item.anchor == target.target_anchor + constant
//
// Constraints are plain data. They are collected by the widget that owns the layout and resolved
// with the helpers below whenever its size changes.
struct Constraint {
  Widget* item;
  Anchor anchor;
  Widget* target = nullptr;
  Anchor target_anchor = Anchor::Leading;
  float constant = 0;

  static Constraint Fixed(Widget& item, Anchor dimension, float constant);
  static Constraint Pin(Widget& item, Anchor edge, Widget& target, Anchor target_edge,
                        float constant = 0);

  bool IsConstant() const { return target == nullptr; }
  Str ToStr() const;
};

// Value of a fixed size constraint on `item` (if there is one).
Optional<float> FixedDimension(Span<const Constraint>, const Widget& item, Anchor dimension);

// Frame (in `container` coordinates) that satisfies the constraints of `item`. The targets of the
// constraints must be either `container` or its direct children. Anchors that are not constrained
// keep the values from the current frame of `item`.
Rect ResolveFrame(Span<const Constraint>, const Widget& item, const Widget& container);

// Number of constraints that reference `widget` (as the item or as the target).
int CountConstraints(Span<const Constraint>, const Widget& widget);

}  // namespace drops::ui
