// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkMatrix.h>
#include <include/core/SkRect.h>

#include "log.hh"

namespace drops {

const LogEntry& operator<<(const LogEntry&, const SkMatrix&);
const LogEntry& operator<<(const LogEntry&, const SkRect&);

}  // namespace drops
