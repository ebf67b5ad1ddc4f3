// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "format.hh"

namespace drops {

std::string_view CleanTypeName(std::string_view mangled) {
#ifdef _WIN32
  // "struct drops::ui::DropWidget" -> "DropWidget"
  if (mangled.starts_with("struct ")) {
    mangled.remove_prefix(7);
  }
  for (int i = mangled.size() - 2; i > 0; --i) {
    if (mangled[i] == ':' && mangled[i + 1] == ':') {
      mangled.remove_prefix(i + 2);
      break;
    }
  }
  return mangled;
#else
  // On Linux we get a C++-mangled name:
  // "N5drops2ui10DropWidgetE"
  if (mangled.starts_with("N") && mangled.ends_with("E")) {
    mangled.remove_prefix(1);
    mangled.remove_suffix(1);
    while (mangled.size() > 1 && mangled[0] >= '0' && mangled[0] <= '9') {
      size_t length = 0;
      size_t i = 0;
      while (i < mangled.size() && mangled[i] >= '0' && mangled[i] <= '9') {
        length = length * 10 + (mangled[i] - '0');
        i++;
      }
      if (i + length < mangled.size()) {
        mangled.remove_prefix(i + length);
      } else {
        mangled.remove_prefix(i);  // final component - remove only its length
        break;
      }
    }
  }
  return mangled;
#endif
}

}  // namespace drops
