// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <fmt/format.h>

#include "str.hh"

namespace drops {

// Format strings using fmt library
template <typename... Args>
Str f(fmt::format_string<Args...> fmt, Args&&... args) {
  return fmt::format(fmt, std::forward<Args>(args)...);
}

// Convert a platform-specific type name (obtained from type_info.name()) into a short class name.
std::string_view CleanTypeName(std::string_view mangled);

}  // namespace drops
