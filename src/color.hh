// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>

#include "str.hh"

namespace drops::color {

// Gray used for secondary content such as template icons (60% opaque #3C3C43).
constexpr SkColor kSecondaryLabel = SkColorSetARGB(0x99, 0x3C, 0x3C, 0x43);

}  // namespace drops::color

namespace drops {

// "#RRGGBB" for opaque colors, "#RRGGBBAA" otherwise.
Str ToStr(SkColor color);

}  // namespace drops
