// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "layout.hh"

#include "format.hh"
#include "widget.hh"

namespace drops::ui {

StrView ToStr(Anchor anchor) {
  switch (anchor) {
    case Anchor::Leading:
      return "leading";
    case Anchor::Top:
      return "top";
    case Anchor::Trailing:
      return "trailing";
    case Anchor::Bottom:
      return "bottom";
    case Anchor::Width:
      return "width";
    case Anchor::Height:
      return "height";
  }
  return "unknown";
}

Constraint Constraint::Fixed(Widget& item, Anchor dimension, float constant) {
  return Constraint{.item = &item, .anchor = dimension, .constant = constant};
}

Constraint Constraint::Pin(Widget& item, Anchor edge, Widget& target, Anchor target_edge,
                           float constant) {
  return Constraint{.item = &item,
                    .anchor = edge,
                    .target = &target,
                    .target_anchor = target_edge,
                    .constant = constant};
}

Str Constraint::ToStr() const {
  Str lhs = f("{}.{}", item->Name(), ui::ToStr(anchor));
  if (IsConstant()) {
    return f("{} == {}", lhs, constant);
  }
  return f("{} == {}.{} {:+}", lhs, target->Name(), ui::ToStr(target_anchor), constant);
}

Optional<float> FixedDimension(Span<const Constraint> constraints, const Widget& item,
                               Anchor dimension) {
  for (auto& c : constraints) {
    if (c.item == &item && c.anchor == dimension && c.IsConstant()) {
      return c.constant;
    }
  }
  return nullopt;
}

static float AnchorValue(const Rect& r, Anchor anchor) {
  switch (anchor) {
    case Anchor::Leading:
      return r.left;
    case Anchor::Top:
      return r.top;
    case Anchor::Trailing:
      return r.right;
    case Anchor::Bottom:
      return r.bottom;
    case Anchor::Width:
      return r.Width();
    case Anchor::Height:
      return r.Height();
  }
  return 0;
}

// Resolves one axis given optional values of its start, end & length.
static void ResolveAxis(Optional<float> start, Optional<float> end, Optional<float> length,
                        float& out_start, float& out_end) {
  float current_length = out_end - out_start;
  if (start && end) {
    out_start = *start;
    out_end = *end;
  } else if (start) {
    out_start = *start;
    out_end = *start + length.value_or(current_length);
  } else if (end) {
    out_end = *end;
    out_start = *end - length.value_or(current_length);
  } else if (length) {
    out_end = out_start + *length;
  }
}

Rect ResolveFrame(Span<const Constraint> constraints, const Widget& item,
                  const Widget& container) {
  Optional<float> values[6];
  for (auto& c : constraints) {
    if (c.item != &item) {
      continue;
    }
    float base = 0;
    if (!c.IsConstant()) {
      Rect target_rect = c.target == &container ? container.Bounds() : c.target->Frame();
      base = AnchorValue(target_rect, c.target_anchor);
    }
    values[static_cast<int>(c.anchor)] = base + c.constant;
  }
  Rect frame = item.Frame();
  ResolveAxis(values[static_cast<int>(Anchor::Leading)], values[static_cast<int>(Anchor::Trailing)],
              values[static_cast<int>(Anchor::Width)], frame.left, frame.right);
  ResolveAxis(values[static_cast<int>(Anchor::Top)], values[static_cast<int>(Anchor::Bottom)],
              values[static_cast<int>(Anchor::Height)], frame.top, frame.bottom);
  return frame;
}

int CountConstraints(Span<const Constraint> constraints, const Widget& widget) {
  int n = 0;
  for (auto& c : constraints) {
    if (c.item == &widget || c.target == &widget) {
      ++n;
    }
  }
  return n;
}

}  // namespace drops::ui
