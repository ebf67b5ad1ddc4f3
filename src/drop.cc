// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "drop.hh"

#include <algorithm>

#include "color.hh"
#include "font.hh"
#include "format.hh"

namespace drops {

SkFont DefaultFont() { return SkFont(ui::DefaultTypeface(), DropText::kDefaultFontSize); }

DropText::DropText(Str text, int number_of_lines, SkFont font, SkColor color)
    : text(std::move(text)),
      number_of_lines(std::max(0, number_of_lines)),
      font(font),
      color(color) {}

StrView ToStr(DropPosition position) {
  switch (position) {
    case DropPosition::kTop:
      return "top";
    case DropPosition::kBottom:
      return "bottom";
  }
  return "unknown";
}

Str DropDuration::ToStr() const {
  if (recommended) {
    return f("recommended ({}s)", kRecommendedSeconds);
  }
  return f("{}s", Value());
}

Drop::Drop(Text title, DropArgs args)
    : title(std::move(title)),
      icon(std::move(args.icon)),
      action(std::move(args.action)),
      position(args.position),
      duration(args.duration),
      background_color(args.background_color),
      accessibility(args.accessibility ? std::move(*args.accessibility)
                                       : Accessibility(this->title.text)) {}

Drop::Drop(StrView title)
    : title(Str(title)),
      icon(nullptr),
      action(nullopt),
      position(Position::kTop),
      duration(Duration::Recommended()),
      background_color(kDefaultDropBackground),
      accessibility(Str(title)) {}

Str Drop::ToStr() const {
  Str action_str = "none";
  if (action) {
    action_str = action->title ? f("\"{}\"", action->title->text) : "whole drop";
  }
  return f("Drop(\"{}\", icon={}, action={}, position={}, duration={}, background={})", title.text,
           HasIcon() ? "yes" : "no", action_str, drops::ToStr(position), duration.ToStr(),
           drops::ToStr(background_color));
}

}  // namespace drops
