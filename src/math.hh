// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPoint.h>
#include <include/core/SkRect.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace drops {

union Vec2 {
  struct {
    float x, y;
  };
  struct {
    float width, height;
  };
  SkPoint sk;

  constexpr Vec2() : x(0), y(0) {}
  constexpr Vec2(float xy) : x(xy), y(xy) {}
  constexpr Vec2(float x, float y) : x(x), y(y) {}
  constexpr Vec2(SkPoint p) : sk(p) {}
  constexpr Vec2 operator-(const Vec2& rhs) const { return Vec2(x - rhs.x, y - rhs.y); }
  constexpr Vec2 operator+(const Vec2& rhs) const { return Vec2(x + rhs.x, y + rhs.y); }
  constexpr Vec2 operator*(float rhs) const { return Vec2(x * rhs, y * rhs); }
  constexpr Vec2 operator/(float rhs) const { return Vec2(x / rhs, y / rhs); }
  constexpr operator SkPoint() const { return sk; }
  constexpr bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  constexpr bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }
  std::string ToStr() const;
};

static_assert(sizeof(Vec2) == 8, "Vec2 is not 8 bytes");

inline Vec2 Round(Vec2 v) { return {roundf(v.x), roundf(v.y)}; }

// Snap the point to the pixel grid of a screen with the given scale (pixels per unit).
inline Vec2 PixelAlign(Vec2 v, float scale) {
  if (scale <= 0) return v;
  return Round(v * scale) / scale;
}

// Axis-aligned rectangle in UI coordinates (y grows downwards).
union Rect {
  SkRect sk;
  struct {
    float left = 0;
    float top = 0;
    float right = 0;
    float bottom = 0;
  };

  constexpr Rect() = default;
  constexpr Rect(SkRect r) : sk(r) {}
  constexpr Rect(float left, float top, float right, float bottom)
      : left(left), top(top), right(right), bottom(bottom) {}

  static constexpr Rect MakeXYWH(float x, float y, float w, float h) {
    return {x, y, x + w, y + h};
  }
  static constexpr Rect MakeOriginSize(Vec2 origin, Vec2 size) {
    return MakeXYWH(origin.x, origin.y, size.width, size.height);
  }
  // Make a rectangle with the top left corner at (0,0) and given size.
  static constexpr Rect MakeCornerZero(Vec2 size) { return {0, 0, size.width, size.height}; }

  constexpr operator const SkRect&() const { return sk; }

  constexpr float Width() const { return right - left; }
  constexpr float Height() const { return bottom - top; }
  constexpr Vec2 Size() const { return {Width(), Height()}; }
  constexpr Vec2 Center() const { return {(left + right) / 2, (top + bottom) / 2}; }

  constexpr bool operator==(const Rect& rhs) const {
    return left == rhs.left && top == rhs.top && right == rhs.right && bottom == rhs.bottom;
  }

  std::string ToStr() const;
};

// Radius that turns a rectangle of the given size into a pill (or a circle when square).
constexpr float PillRadius(Vec2 size) { return std::min(size.width, size.height) / 2; }

}  // namespace drops
