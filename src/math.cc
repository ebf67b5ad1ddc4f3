// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "math.hh"

#include "format.hh"

namespace drops {

std::string Vec2::ToStr() const { return f("Vec2({}, {})", x, y); }

std::string Rect::ToStr() const {
  return f("Rect(l={}, t={}, r={}, b={}, w={}, h={})", left, top, right, bottom, Width(),
           Height());
}

}  // namespace drops
