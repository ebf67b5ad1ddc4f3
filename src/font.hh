// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkFontMgr.h>
#include <include/core/SkTypeface.h>

namespace drops::ui {

// Font manager of the platform. DirectWrite on Windows, fonts from `kFontDirectory` elsewhere.
sk_sp<SkFontMgr> GetFontMgr();

// Directory scanned (recursively) for font files on platforms without DirectWrite.
constexpr const char* kFontDirectory = "/usr/share/fonts/";

// Regular style of the default family of `GetFontMgr()`. Used for text that doesn't specify its
// own typeface.
sk_sp<SkTypeface> DefaultTypeface();

}  // namespace drops::ui
