// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "font.hh"

#include <include/core/SkFontStyle.h>

#if defined(_WIN32)
#include <include/ports/SkTypeface_win.h>
#else
#include <include/ports/SkFontMgr_directory.h>
#endif

#include "log.hh"

namespace drops::ui {

sk_sp<SkFontMgr> GetFontMgr() {
  static sk_sp<SkFontMgr> font_mgr = []() {
#if defined(_WIN32)
    return SkFontMgr_New_DirectWrite();
#else
    return SkFontMgr_New_Custom_Directory(kFontDirectory);
#endif
  }();
  return font_mgr;
}

sk_sp<SkTypeface> DefaultTypeface() {
  static sk_sp<SkTypeface> typeface = []() {
    sk_sp<SkFontMgr> font_mgr = GetFontMgr();
    sk_sp<SkTypeface> result = font_mgr->legacyMakeTypeface(nullptr, SkFontStyle());
    if (result == nullptr) {
      ERROR << "No default typeface available. Text without its own typeface won't be visible.";
    }
    return result;
  }();
  return typeface;
}

}  // namespace drops::ui
