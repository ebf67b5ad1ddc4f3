// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>

namespace drops::time {

using Duration = std::chrono::duration<int64_t, std::ratio<1, 1000000000>>;

using FloatDuration = std::chrono::duration<double>;

// Converts to nanoseconds, saturating at the limits of `Duration`. NaN becomes zero.
inline Duration Defloat(FloatDuration d) {
  double ns = d.count() * Duration::period::den / Duration::period::num;
  if (std::isnan(ns)) {
    return Duration::zero();
  }
  constexpr double kLimit = 9223372036854775808.0;  // 2^63
  if (ns >= kLimit) {
    return Duration::max();
  }
  if (ns <= -kLimit) {
    return Duration::min();
  }
  return Duration((Duration::rep)ns);
}

inline Duration FromSeconds(double s) { return Defloat(FloatDuration(s)); }

}  // namespace drops::time
