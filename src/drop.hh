// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>
#include <include/core/SkFont.h>
#include <include/core/SkImage.h>

#include "fn.hh"
#include "optional.hh"
#include "str.hh"
#include "time.hh"

namespace drops {

// Font used when the text doesn't specify one: `ui::DefaultTypeface()` at 12 units.
SkFont DefaultFont();

// Styled text of a drop.
struct DropText {
  constexpr static float kDefaultFontSize = 12;

  Str text;
  int number_of_lines;  // maximum number of lines; 0 means no limit
  SkFont font;
  SkColor color;

  // Negative `number_of_lines` is treated as 0 (no limit).
  explicit DropText(Str text, int number_of_lines = 1, SkFont font = DefaultFont(),
                    SkColor color = SK_ColorWHITE);
};

// Edge of the screen from which the drop is presented.
enum class DropPosition { kTop, kBottom };

StrView ToStr(DropPosition);

// How long the drop stays on screen.
//
// Values are resolved when read: `Recommended()` is 2 seconds and explicit durations are made
// non-negative (absolute value).
class DropDuration {
 public:
  constexpr static double kRecommendedSeconds = 2.0;

  static constexpr DropDuration Recommended() { return DropDuration(); }
  static constexpr DropDuration Seconds(double seconds) { return DropDuration(seconds); }

  // Allows `duration = 3.5`.
  constexpr DropDuration(double seconds) : recommended(false), seconds(seconds) {}

  constexpr bool IsRecommended() const { return recommended; }

  // Resolved number of seconds.
  constexpr double Value() const {
    if (recommended) {
      return kRecommendedSeconds;
    }
    return seconds < 0 ? -seconds : seconds;
  }

  time::Duration ToTime() const { return time::FromSeconds(Value()); }

  constexpr bool operator==(const DropDuration&) const = default;

  Str ToStr() const;

 private:
  constexpr DropDuration() : recommended(true), seconds(0) {}

  bool recommended;
  double seconds;
};

// Something to do when the drop is tapped.
//
// With a `title` the drop shows a button and only the button reacts to taps. Without it the whole
// drop is tappable.
struct DropAction {
  Optional<DropText> title = nullopt;
  Fn<void()> handler;
};

struct DropAccessibility {
  // Message announced when the drop is shown.
  Str message;

  DropAccessibility(Str message) : message(std::move(message)) {}
  DropAccessibility(const char* message) : message(message) {}
};

// Black at 15% opacity.
constexpr SkColor kDefaultDropBackground = SkColorSetARGB(0x26, 0x00, 0x00, 0x00);

// Optional parameters of a drop. Meant to be used with designated initializers:
//
//   Drop drop(DropText("Copied"), {.icon = copy_icon, .duration = 1.5});
struct DropArgs {
  SkColor background_color = kDefaultDropBackground;
  sk_sp<SkImage> icon = nullptr;
  Optional<DropAction> action = nullopt;
  DropPosition position = DropPosition::kTop;
  DropDuration duration = DropDuration::Recommended();
  // When not given, the title text is used as the message.
  Optional<DropAccessibility> accessibility = nullopt;
};

// Immutable description of a single drop: what to show and how to react to taps.
struct Drop {
  using Text = DropText;
  using Position = DropPosition;
  using Duration = DropDuration;
  using Action = DropAction;
  using Accessibility = DropAccessibility;

  Drop(Text title, DropArgs args = {});

  // Plain title with default styling, presented from the top for the recommended duration.
  Drop(StrView title);
  Drop(const char* title) : Drop(StrView(title)) {}

  const Text title;
  const sk_sp<SkImage> icon;
  const Optional<Action> action;
  const Position position;
  const Duration duration;
  const SkColor background_color;
  const Accessibility accessibility;

  bool HasIcon() const { return icon != nullptr; }
  bool HasAction() const { return action.has_value(); }
  bool HasActionTitle() const { return action.has_value() && action->title.has_value(); }

  Str ToStr() const;
};

}  // namespace drops
