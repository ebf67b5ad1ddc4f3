// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>
#include <include/core/SkFont.h>

#include "fn.hh"
#include "str.hh"
#include "vec.hh"
#include "widget.hh"

namespace drops::ui {

// Splits `text` into lines no wider than `max_width`. Explicit '\n' always starts a new line.
// When `max_lines` is positive, the output is cut to that many lines and the last one ends with an
// ellipsis. Lines that are still too wide (a single long word) are cut with an ellipsis as well.
Vec<Str> WrapText(StrView text, const Fn<float(StrView)>& measure_width, int max_lines,
                  float max_width);

// Size of `text` rendered with `font`, wrapped to `max_width` and limited to `max_lines` (0 means
// no limit).
using TextMeasureFn =
    Fn<Vec2(StrView text, const SkFont& font, int max_lines, float max_width)>;

// Default measurement, based on the metrics of the Skia font.
Vec2 MeasureText(StrView text, const SkFont& font, int max_lines, float max_width);

// Left-aligned, multi-line text.
struct Label : Widget, PaintMixin {
  Str text;
  SkFont font;
  int number_of_lines;  // 0 means no limit
  TextMeasureFn measure;

  Label(Widget* parent, Str text, SkFont font, SkColor color, int number_of_lines,
        TextMeasureFn measure = MeasureText);

  StrView Name() const override { return "Label"; }
  Vec2 PreferredSize(float max_width) const override;
  void Draw(SkCanvas&) const override;

  // Lines of text that fit in the current width of the label. Wrapped with `measure`, like
  // `PreferredSize`.
  Vec<Str> Lines() const;
};

}  // namespace drops::ui
