// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_text.hh"

#include <include/core/SkFontMetrics.h>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std;

namespace drops::ui {

static constexpr StrView kEllipsis = "…";

static void PopUtf8Char(Str& s) {
  while (!s.empty()) {
    unsigned char c = s.back();
    s.pop_back();
    if ((c & 0xC0) != 0x80) {  // not a continuation byte
      break;
    }
  }
}

// Removes characters from the end of `line` until it fits in `max_width` together with an ellipsis.
static void Truncate(Str& line, const Fn<float(StrView)>& measure_width, float max_width) {
  while (!line.empty() &&
         (line.back() == ' ' || measure_width(line + Str(kEllipsis)) > max_width)) {
    PopUtf8Char(line);
  }
  line += kEllipsis;
}

static void WrapParagraph(StrView paragraph, const Fn<float(StrView)>& measure_width,
                          float max_width, Vec<Str>& out) {
  Str line;
  size_t start = 0;
  while (start <= paragraph.size()) {
    size_t end = paragraph.find(' ', start);
    if (end == StrView::npos) end = paragraph.size();
    StrView word = paragraph.substr(start, end - start);
    start = end + 1;
    if (word.empty()) continue;
    if (line.empty()) {
      line = word;
      continue;
    }
    Str candidate = line + " " + Str(word);
    if (measure_width(candidate) <= max_width) {
      line = std::move(candidate);
    } else {
      out.push_back(std::move(line));
      line = word;
    }
  }
  out.push_back(std::move(line));
}

Vec<Str> WrapText(StrView text, const Fn<float(StrView)>& measure_width, int max_lines,
                  float max_width) {
  Vec<Str> lines;
  size_t start = 0;
  while (true) {
    size_t end = text.find('\n', start);
    if (end == StrView::npos) {
      WrapParagraph(text.substr(start), measure_width, max_width, lines);
      break;
    }
    WrapParagraph(text.substr(start, end - start), measure_width, max_width, lines);
    start = end + 1;
  }

  if (max_lines > 0 && lines.size() > (size_t)max_lines) {
    lines.resize(max_lines);
    Truncate(lines.back(), measure_width, max_width);
  }
  for (auto& line : lines) {
    if (measure_width(line) > max_width) {
      Truncate(line, measure_width, max_width);
    }
  }
  return lines;
}

Vec2 MeasureText(StrView text, const SkFont& font, int max_lines, float max_width) {
  if (text.empty()) {
    return Vec2(0, 0);
  }
  auto measure_width = [&font](StrView s) {
    return font.measureText(s.data(), s.size(), SkTextEncoding::kUTF8);
  };
  auto lines = WrapText(text, measure_width, max_lines, max_width);
  float width = 0;
  for (auto& line : lines) {
    width = max(width, measure_width(line));
  }
  return Vec2(ceilf(width), ceilf(lines.size() * font.getSpacing()));
}

Label::Label(Widget* parent, Str text, SkFont font, SkColor color, int number_of_lines,
             TextMeasureFn measure)
    : Widget(parent),
      text(std::move(text)),
      font(font),
      number_of_lines(max(0, number_of_lines)),
      measure(measure ? std::move(measure) : TextMeasureFn(MeasureText)) {
  paint.setColor(color);
  paint.setAntiAlias(true);
}

Vec2 Label::PreferredSize(float max_width) const {
  return measure(text, font, number_of_lines, max_width);
}

Vec<Str> Label::Lines() const {
  if (text.empty()) {
    return {};
  }
  auto measure_width = [this](StrView s) {
    return measure(s, font, 1, std::numeric_limits<float>::infinity()).width;
  };
  return WrapText(text, measure_width, number_of_lines, size.width);
}

void Label::Draw(SkCanvas& canvas) const {
  SkFontMetrics metrics;
  float spacing = font.getMetrics(&metrics);
  float baseline = -metrics.fAscent;
  for (auto& line : Lines()) {
    canvas.drawSimpleText(line.data(), line.size(), SkTextEncoding::kUTF8, 0, baseline, font,
                          paint);
    baseline += spacing;
  }
}

}  // namespace drops::ui
