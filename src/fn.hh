// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <functional>

// Shortcut for std::function
namespace drops {

template <typename T>
using Fn = std::function<T>;

}  // namespace drops
