// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "log.hh"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "format.hh"

namespace drops {

static std::vector<Logger>& Loggers() {
  static std::vector<Logger> loggers = {
      [](const LogEntry& e) { printf("%s\n", e.buffer.c_str()); },
  };
  return loggers;
}

static int indent = 0;

void AddLogger(Logger logger) { Loggers().push_back(std::move(logger)); }

void ClearLoggers() { Loggers().clear(); }

void RestoreDefaultLoggers() {
  Loggers().clear();
  Loggers().emplace_back([](const LogEntry& e) { printf("%s\n", e.buffer.c_str()); });
}

void LOG_Indent(int n) { indent += n; }

void LOG_Unindent(int n) { indent -= n; }

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level),
      timestamp(std::chrono::system_clock::now()),
      location(location),
      buffer(),
      errsv(errno) {
  for (int i = 0; i < indent; ++i) {
    buffer += " ";
  }
}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Ignore) {
    return;
  }

  if (log_level == LogLevel::Fatal) {
    buffer += f(" Crashing in {}:{} [{}].", location.file_name(), location.line(),
                location.function_name());
  }

  for (auto& logger : Loggers()) {
    logger(*this);
  }

  if (log_level == LogLevel::Fatal) {
    fflush(stdout);
    abort();
  }
}

const LogEntry& operator<<(const LogEntry& logger, int i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, float x) {
  logger.buffer += f("{}", x);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, double x) {
  logger.buffer += f("{}", x);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, std::string_view s) {
  logger.buffer += s;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const char* s) {
  logger.buffer += s;
  return logger;
}

}  // namespace drops
