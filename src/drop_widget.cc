// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "drop_widget.hh"

#include <include/core/SkPaint.h>

#include <algorithm>

#include "action.hh"
#include "log.hh"
#include "pointer.hh"

using namespace std;

namespace drops::ui {

StrView ToStr(TapTarget target) {
  switch (target) {
    case TapTarget::kNone:
      return "none";
    case TapTarget::kWholeCard:
      return "whole card";
    case TapTarget::kActionElement:
      return "action element";
  }
  return "unknown";
}

TapTarget TapTargetFor(const Drop& drop) {
  if (!drop.HasAction()) {
    return TapTarget::kNone;
  }
  return drop.HasActionTitle() ? TapTarget::kActionElement : TapTarget::kWholeCard;
}

DropWidget::DropWidget(Widget* parent, Drop drop_arg, DropWidgetConfig config_arg)
    : Widget(parent),
      drop(std::move(drop_arg)),
      config(std::move(config_arg)),
      tap_target(TapTargetFor(drop)) {
  stack = make_unique<Stack>(this, Axis::Horizontal, Alignment::Center, kSpacing);
  stack->pixel_scale = config.screen_scale;

  if (drop.HasIcon()) {
    icon = &stack->Add<Image>(drop.icon, config.icon_tint);
  }

  text_block = &stack->Add<Stack>(Axis::Vertical, Alignment::Fill, kTextBlockSpacing);
  text_block->pixel_scale = config.screen_scale;
  title = &text_block->Add<Label>(drop.title.text, drop.title.font, drop.title.color,
                                  drop.title.number_of_lines, config.measure_text);
  stack->flexible = text_block;

  if (tap_target == TapTarget::kActionElement) {
    auto& action_title = *drop.action->title;
    action_button = &stack->Add<Button>(ButtonArgs{.on_click = drop.action->handler});
    // The button uses the font of the drop title (only the text & color come from the action).
    action_button->SetChild<Label>(action_title.text, drop.title.font, action_title.color,
                                   action_title.number_of_lines, config.measure_text);
  }

  constraints = CreateLayoutConstraints();
  stack->constraints = constraints;

  if (config.verbose) {
    LOG << "Built " << drop << " with " << (int)Arranged().size()
        << " arranged children, tap target: " << ui::ToStr(tap_target);
    LOG_Indent();
    for (auto& c : constraints) {
      LOG << c;
    }
    LOG_Unindent();
  }
}

DropWidget::~DropWidget() {}

Vec<Constraint> DropWidget::CreateLayoutConstraints() {
  Vec<Constraint> ret;

  if (icon) {
    ret.push_back(Constraint::Fixed(*icon, Anchor::Width, kIconSize));
    ret.push_back(Constraint::Fixed(*icon, Anchor::Height, kIconSize));
  }

  ret.push_back(Constraint::Pin(*stack, Anchor::Leading, *this, Anchor::Leading, kInsets.left));
  ret.push_back(Constraint::Pin(*stack, Anchor::Top, *this, Anchor::Top, kInsets.top));
  ret.push_back(
      Constraint::Pin(*stack, Anchor::Trailing, *this, Anchor::Trailing, -kInsets.right));
  ret.push_back(Constraint::Pin(*stack, Anchor::Bottom, *this, Anchor::Bottom, -kInsets.bottom));

  return ret;
}

Vec2 DropWidget::PreferredSize(float max_width) const {
  Vec2 content = stack->PreferredSize(max(0.f, max_width - kInsets.Horizontal()));
  return Vec2(min(max_width, content.width + kInsets.Horizontal()),
              content.height + kInsets.Vertical());
}

void DropWidget::SizeChanged() {
  corner_radius = PillRadius(size);
  stack->SetFrame(ResolveFrame(constraints, *stack, *this));
}

SkRRect DropWidget::RRect() const {
  return SkRRect::MakeRectXY(Bounds().sk, corner_radius, corner_radius);
}

SkPath DropWidget::Shape() const { return SkPath::RRect(RRect()); }

void DropWidget::Draw(SkCanvas& canvas) const {
  SkPaint background;
  background.setAntiAlias(true);
  background.setColor(drop.background_color);
  canvas.drawRRect(RRect(), background);
  DrawChildren(canvas);
}

void DropWidget::FillChildren(Vec<Widget*>& children) { children.push_back(stack.get()); }

std::unique_ptr<Action> DropWidget::FindAction(Pointer& pointer, PointerButton btn) {
  if (tap_target != TapTarget::kWholeCard || btn != PointerButton::Left) {
    return nullptr;
  }
  // Copy because the handler may destroy this widget.
  Fn<void()> handler = drop.action->handler;
  return make_unique<TapAction>(pointer, handler);
}

}  // namespace drops::ui
