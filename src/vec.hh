// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <span>
#include <vector>

namespace drops {

template <typename T>
using Vec = std::vector<T>;

template <typename T>
using Span = std::span<T>;

}  // namespace drops
