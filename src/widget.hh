// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkCanvas.h>
#include <include/core/SkM44.h>
#include <include/core/SkMatrix.h>
#include <include/core/SkPaint.h>
#include <include/core/SkPath.h>

#include <memory>
#include <typeinfo>

#include "action.hh"
#include "format.hh"
#include "math.hh"
#include "str.hh"
#include "vec.hh"

namespace drops::ui {

struct Widget;
struct Pointer;

// Transform from the local coordinates of the widget to the coordinates of its topmost ancestor.
SkMatrix TransformUp(const Widget& from);
// Transform from the coordinates of the topmost ancestor to the local coordinates of the widget.
SkMatrix TransformDown(const Widget& to);

enum class PointerButton { Unknown, Left, Middle, Right, Count };

// Widgets are things that can be drawn to the SkCanvas and react to pointer input.
//
// Each widget has a size and an origin (top left corner) within its parent. Children are owned by
// their parents (usually through unique_ptr members) and keep a non-owning `parent` link.
struct Widget {
  Widget(Widget* parent);
  Widget(const Widget&) = delete;
  virtual ~Widget();

  Widget* parent;
  SkM44 local_to_parent = SkM44();
  Vec2 size;

  // The name for widgets of this type. English proper noun, UTF-8, capitalized.
  virtual StrView Name() const {
    const std::type_info& info = typeid(*this);
    return CleanTypeName(info.name());
  }

  // Local coordinates.
  Rect Bounds() const { return Rect::MakeCornerZero(size); }

  // Parent coordinates. Only translation is taken into account.
  Rect Frame() const;

  // Moves the widget within its parent and changes its size.
  void SetFrame(Rect frame);

  // Changes the size of the widget. `SizeChanged` is called even if the size stays the same, so
  // overrides must be idempotent.
  void Resize(Vec2 new_size);

  // Called after every change of `size`. Widgets that depend on their size (shape, child layout)
  // should update themselves here.
  virtual void SizeChanged() {}

  // Size that the widget would like to have when its width is limited to `max_width`.
  virtual Vec2 PreferredSize(float max_width) const { return size; }

  virtual SkPath Shape() const { return SkPath::Rect(Bounds().sk); }

  virtual void Draw(SkCanvas& canvas) const { return DrawChildren(canvas); }

  void DrawChildren(SkCanvas&) const;

  // Used to obtain references to the child widgets in a generic fashion.
  // Widgets are stored in front-to-back order.
  virtual void FillChildren(Vec<Widget*>& children) {}

  Vec<Widget*> Children() const {
    Vec<Widget*> children;
    const_cast<Widget*>(this)->FillChildren(children);
    return children;
  }

  // This can be used to block pointer events from propagating to children.
  virtual bool AllowChildPointerEvents(Widget& child) const { return true; }

  // Returns an action that should be started when the given button is pressed over this widget.
  // Widgets that don't react to the button return nullptr and let their parents handle it.
  virtual std::unique_ptr<Action> FindAction(Pointer&, PointerButton) { return nullptr; }

  struct ParentsView {
    Widget* start;

    struct end_iterator {};

    struct iterator {
      Widget* widget;
      iterator(Widget* widget) : widget(widget) {}
      Widget* operator*() { return widget; }
      iterator& operator++() {
        widget = widget->parent;
        return *this;
      }
      bool operator!=(const end_iterator&) { return widget != nullptr; }
    };

    iterator begin() { return iterator(start); }
    end_iterator end() { return end_iterator(); }
  };

  ParentsView Parents() const { return ParentsView{const_cast<Widget*>(this)}; }

  Str ToStr() const;
};

struct PaintMixin {
  SkPaint paint;
};

}  // namespace drops::ui
