// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "color.hh"

#include "format.hh"

namespace drops {

Str ToStr(SkColor color) {
  if (SkColorGetA(color) == 0xff) {
    return f("#{:02x}{:02x}{:02x}", SkColorGetR(color), SkColorGetG(color), SkColorGetB(color));
  }
  return f("#{:02x}{:02x}{:02x}{:02x}", SkColorGetR(color), SkColorGetG(color),
           SkColorGetB(color), SkColorGetA(color));
}

}  // namespace drops
