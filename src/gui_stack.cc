// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_stack.hh"

#include <algorithm>

using namespace std;

namespace drops::ui {

Stack::Stack(Widget* parent, Axis axis, Alignment alignment, float spacing)
    : Widget(parent), axis(axis), alignment(alignment), spacing(spacing) {}

Vec<Widget*> Stack::Arranged() const {
  Vec<Widget*> ret;
  for (auto& child : arranged) {
    ret.push_back(child.get());
  }
  return ret;
}

void Stack::FillChildren(Vec<Widget*>& children) {
  for (auto& child : arranged) {
    children.push_back(child.get());
  }
}

float Stack::TotalSpacing() const {
  if (arranged.size() < 2) {
    return 0;
  }
  return spacing * (arranged.size() - 1);
}

Vec2 Stack::ChildSize(const Widget& child, float max_width) const {
  auto fixed_w = FixedDimension(constraints, child, Anchor::Width);
  auto fixed_h = FixedDimension(constraints, child, Anchor::Height);
  if (fixed_w && fixed_h) {
    return Vec2(*fixed_w, *fixed_h);
  }
  Vec2 preferred = child.PreferredSize(fixed_w.value_or(max_width));
  return Vec2(fixed_w.value_or(preferred.width), fixed_h.value_or(preferred.height));
}

Vec2 Stack::PreferredSize(float max_width) const {
  Vec2 ret;
  if (axis == Axis::Horizontal) {
    float used = TotalSpacing();
    for (auto& child : arranged) {
      if (child.get() == flexible) continue;
      Vec2 s = ChildSize(*child, max_width);
      used += s.width;
      ret.height = max(ret.height, s.height);
    }
    ret.width = used;
    if (flexible) {
      Vec2 s = ChildSize(*flexible, max(0.f, max_width - used));
      ret.width += s.width;
      ret.height = max(ret.height, s.height);
    }
  } else {
    ret.height = TotalSpacing();
    for (auto& child : arranged) {
      Vec2 s = ChildSize(*child, max_width);
      ret.height += s.height;
      ret.width = max(ret.width, s.width);
    }
  }
  return ret;
}

void Stack::Layout() {
  bool horizontal = axis == Axis::Horizontal;
  float main_length = horizontal ? size.width : size.height;
  float cross_length = horizontal ? size.height : size.width;
  float max_width = size.width;

  Vec<Vec2> sizes;
  float used = TotalSpacing();
  for (auto& child : arranged) {
    Vec2 s = child.get() == flexible ? Vec2() : ChildSize(*child, max_width);
    sizes.push_back(s);
    used += horizontal ? s.width : s.height;
  }
  for (size_t i = 0; i < arranged.size(); ++i) {
    if (arranged[i].get() != flexible) continue;
    float remaining = max(0.f, main_length - used);
    if (horizontal) {
      sizes[i] = Vec2(remaining, ChildSize(*flexible, remaining).height);
    } else {
      sizes[i] = Vec2(ChildSize(*flexible, max_width).width, remaining);
    }
  }

  float pos = 0;
  for (size_t i = 0; i < arranged.size(); ++i) {
    Vec2 s = sizes[i];
    float child_main = horizontal ? s.width : s.height;
    float child_cross = horizontal ? s.height : s.width;
    if (alignment == Alignment::Fill) {
      child_cross = cross_length;
    }
    float cross_pos = (cross_length - child_cross) / 2;
    Vec2 origin = horizontal ? Vec2(pos, cross_pos) : Vec2(cross_pos, pos);
    Vec2 child_size = horizontal ? Vec2(child_main, child_cross) : Vec2(child_cross, child_main);
    arranged[i]->SetFrame(Rect::MakeOriginSize(PixelAlign(origin, pixel_scale), child_size));
    pos += child_main + spacing;
  }
}

}  // namespace drops::ui
