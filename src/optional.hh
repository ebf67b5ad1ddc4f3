// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>

namespace drops {

template <typename T>
using Optional = std::optional<T>;

using std::nullopt;

}  // namespace drops
