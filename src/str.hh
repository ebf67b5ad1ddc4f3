// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <string_view>

namespace drops {

using Str = std::string;
using StrView = std::string_view;

}  // namespace drops
