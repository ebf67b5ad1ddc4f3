// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>
#include <include/core/SkRRect.h>

#include <memory>

#include "color.hh"
#include "drop.hh"
#include "gui_button.hh"
#include "gui_image.hh"
#include "gui_stack.hh"
#include "gui_text.hh"
#include "layout.hh"
#include "optional.hh"
#include "widget.hh"

namespace drops::ui {

// Values that normally come from the UI runtime (screen, system palette, text engine). Passed in
// explicitly so that building a drop is deterministic.
struct DropWidgetConfig {
  // Pixels per unit. Child origins are snapped to this pixel grid.
  float screen_scale = 1;

  // Color applied to the icon. When not set, the icon keeps its own colors.
  Optional<SkColor> icon_tint = color::kSecondaryLabel;

  TextMeasureFn measure_text = MeasureText;

  // Log the structure of every built drop.
  bool verbose = false;
};

// Which part of the drop reacts to taps.
enum class TapTarget {
  kNone,           // no action
  kWholeCard,      // action without a title
  kActionElement,  // action with a title - only its button
};

StrView ToStr(TapTarget);

TapTarget TapTargetFor(const Drop&);

// Notification card built from a single Drop.
//
// The structure of the card is decided once, in the constructor:
//
//   [icon] [text block: title] [action button]
//
// The icon exists only if the drop has an icon and the button only if the drop's action has a
// title. Missing elements are not created at all, so they don't take any space and no constraint
// refers to them.
//
// The card never changes its structure afterwards. The presenter decides its size (usually based
// on `PreferredSize`) and the card lays out its children and rounds its corners (half of the
// shorter side) on every size change.
struct DropWidget : Widget {
  constexpr static float kIconSize = 16;
  constexpr static float kSpacing = 10;
  constexpr static float kTextBlockSpacing = -1;
  constexpr static Insets kInsets = {.top = 16, .left = 12, .bottom = 16, .right = 12};

  const Drop drop;
  const DropWidgetConfig config;
  const TapTarget tap_target;

  DropWidget(Widget* parent, Drop drop, DropWidgetConfig config = {});
  ~DropWidget() override;

  StrView Name() const override { return "Drop"; }

  // Children of the horizontal stack, in order.
  Vec<Widget*> Arranged() const { return stack->Arranged(); }

  // nullptr when the drop has no icon.
  Image* Icon() const { return icon; }
  Label& Title() const { return *title; }
  Stack& TextBlock() const { return *text_block; }
  // nullptr when the drop has no titled action.
  Button* ActionButton() const { return action_button; }
  Stack& ContentStack() const { return *stack; }

  Span<const Constraint> Constraints() const { return constraints; }

  float CornerRadius() const { return corner_radius; }

  Vec2 PreferredSize(float max_width) const override;
  void SizeChanged() override;
  SkRRect RRect() const;
  SkPath Shape() const override;
  void Draw(SkCanvas&) const override;
  void FillChildren(Vec<Widget*>& children) override;
  std::unique_ptr<Action> FindAction(Pointer&, PointerButton) override;

 private:
  Vec<Constraint> CreateLayoutConstraints();

  std::unique_ptr<Stack> stack;
  Image* icon = nullptr;
  Stack* text_block = nullptr;
  Label* title = nullptr;
  Button* action_button = nullptr;
  Vec<Constraint> constraints;
  float corner_radius = 0;
};

}  // namespace drops::ui
