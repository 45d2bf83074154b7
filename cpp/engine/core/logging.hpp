#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging (Hardened)
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy plus an optional mirror file
    (one run log per experiment directory).

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation); parallel sweeps log
    from worker threads.
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.

Line format:
  [2026-10-17T09:00:00.000Z][INFO] optimizer: message
===========================================================
*/

#include <string>
#include <string_view>

namespace fleetopt {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parses "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves *out untouched on unknown input.
bool parse_log_level(std::string_view s, LogLevel* out) noexcept;

// Mirror every emitted line into `path` (truncated). Returns false if the
// file cannot be opened; console logging continues either way.
bool set_log_file(const std::string& path) noexcept;
void close_log_file() noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace fleetopt
