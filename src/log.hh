// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//   FATAL << "stop the execution / print stack trace";
//
// Logged messages can have multiple lines - the extra lines are not indented or
// treated in any special way.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.

#include <chrono>
#include <concepts>
#include <source_location>
#include <string>
#include <string_view>

#include "fn.hh"

namespace drops {

enum class LogLevel { Info, Error, Fatal, Ignore };

struct LogEntry {
  LogLevel log_level;
  std::chrono::system_clock::time_point timestamp;
  std::source_location location;
  mutable std::string buffer;
  int errsv;  // saved errno

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

// Sinks receive every finished entry. A sink that prints to stdout is installed by default.
using Logger = Fn<void(const LogEntry&)>;

void AddLogger(Logger);

// Removes all sinks (including the default one). Used by tests that capture log output.
void ClearLoggers();

// Reinstalls the default stdout sink after `ClearLoggers`.
void RestoreDefaultLoggers();

#define LOG ::drops::LogEntry(::drops::LogLevel::Info)
#define ERROR ::drops::LogEntry(::drops::LogLevel::Error)
#define FATAL ::drops::LogEntry(::drops::LogLevel::Fatal)

const LogEntry& operator<<(const LogEntry&, int);
const LogEntry& operator<<(const LogEntry&, unsigned);
const LogEntry& operator<<(const LogEntry&, unsigned long);
const LogEntry& operator<<(const LogEntry&, unsigned long long);
const LogEntry& operator<<(const LogEntry&, float);
const LogEntry& operator<<(const LogEntry&, double);
const LogEntry& operator<<(const LogEntry&, std::string_view);
const LogEntry& operator<<(const LogEntry&, const char*);

template <typename T>
concept loggable = requires(const T& v) {
  { v.ToStr() } -> std::convertible_to<std::string_view>;
};

inline const LogEntry& operator<<(const LogEntry& logger, const loggable auto& t) {
  return logger << std::string_view(t.ToStr());
}

void LOG_Indent(int n = 2);

void LOG_Unindent(int n = 2);

}  // namespace drops
