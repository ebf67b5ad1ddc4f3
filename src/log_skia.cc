// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "log_skia.hh"

#include "format.hh"

namespace drops {

const LogEntry& operator<<(const LogEntry& logger, const SkMatrix& m) {
  int prefix_length = logger.buffer.size();
  std::string out = f("[{:.4f}, {:.4f}, {:.4f}]\n", m.get(0), m.get(1), m.get(2));
  for (int i = 0; i < prefix_length; ++i) out += ' ';
  out += f("[{:.4f}, {:.4f}, {:.4f}]\n", m.get(3), m.get(4), m.get(5));
  for (int i = 0; i < prefix_length; ++i) out += ' ';
  out += f("[{:.4f}, {:.4f}, {:.4f}]", m.get(6), m.get(7), m.get(8));
  logger << out;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const SkRect& r) {
  return logger << f("{}x{}{:+}{:+}", r.width(), r.height(), r.x(), r.y());
}

}  // namespace drops
