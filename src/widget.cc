// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "widget.hh"

#include <ranges>

#include "format.hh"

using namespace std;

namespace drops::ui {

Widget::Widget(Widget* parent) : parent(parent) {}

Widget::~Widget() {}

Rect Widget::Frame() const {
  Vec2 origin(local_to_parent.rc(0, 3), local_to_parent.rc(1, 3));
  return Rect::MakeOriginSize(origin, size);
}

void Widget::SetFrame(Rect frame) {
  local_to_parent = SkM44::Translate(frame.left, frame.top);
  Resize(frame.Size());
}

void Widget::Resize(Vec2 new_size) {
  size = Vec2(max(0.f, new_size.width), max(0.f, new_size.height));
  SizeChanged();
}

void Widget::DrawChildren(SkCanvas& canvas) const {
  for (auto* child : ranges::reverse_view(Children())) {
    canvas.save();
    canvas.concat(child->local_to_parent);
    child->Draw(canvas);
    canvas.restore();
  }
}

SkMatrix TransformUp(const Widget& from) {
  SkMatrix up = from.local_to_parent.asM33();
  if (from.parent) {
    up.postConcat(TransformUp(*from.parent));
  }
  return up;
}

SkMatrix TransformDown(const Widget& to) {
  auto up = TransformUp(to);
  SkMatrix down;
  if (!up.invert(&down)) {
    return SkMatrix::I();
  }
  return down;
}

Str Widget::ToStr() const {
  Str ret;
  for (Widget* w : Parents()) {
    ret = Str(w->Name()) + (ret.empty() ? "" : " -> " + ret);
  }
  return ret;
}

}  // namespace drops::ui
