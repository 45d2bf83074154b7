/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Line format:
  [2025-03-01T12:00:00.123Z][INFO] greedy: phase 1: seeding 8 fuel types

Sinks:
  - console: WARN/ERROR on stderr, DEBUG/INFO on stdout
  - optional mirror file (set_log_file), truncated on open

Threading:
  - Level is an atomic read without the lock.
  - One mutex serializes both sinks so sweep workers never interleave
    partial lines.
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fleetopt {

namespace {

struct LogSink {
  std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
  std::mutex mu;
  std::ofstream mirror;
};

LogSink& sink() {
  static LogSink s;
  return s;
}

const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

// 2025-03-01T12:00:00.123Z
std::string utc_timestamp_ms() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t tt = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
  return buf;
}

struct LevelName {
  const char* name;
  LogLevel level;
};

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept {
  sink().level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(sink().level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  static constexpr LevelName kNames[] = {{"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
                {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR}};
  for (const auto& n : kNames) {
    if (equals_ignore_case(s, n.name)) {
      *out = n.level;
      return true;
    }
  }
  return false;
}

bool set_log_file(const std::string& path) noexcept {
  LogSink& s = sink();
  try {
    std::lock_guard<std::mutex> lk(s.mu);
    if (s.mirror.is_open()) s.mirror.close();
    s.mirror.open(path, std::ios::out | std::ios::trunc);
    return s.mirror.is_open();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[log] cannot open '%s': %s\n", path.c_str(), e.what());
    return false;
  }
}

void close_log_file() noexcept {
  LogSink& s = sink();
  try {
    std::lock_guard<std::mutex> lk(s.mu);
    if (s.mirror.is_open()) s.mirror.close();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[log] cannot close log file: %s\n", e.what());
  }
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  LogSink& s = sink();
  if (static_cast<int>(lvl) < s.level.load(std::memory_order_relaxed)) return;

  try {
    std::string line;
    line.reserve(msg.size() + component.size() + 40);
    line += '[';
    line += utc_timestamp_ms();
    line += "][";
    line += level_tag(lvl);
    line += "] ";
    if (!component.empty()) {
      line.append(component.data(), component.size());
      line += ": ";
    }
    line += msg;
    line += '\n';

    std::lock_guard<std::mutex> lk(s.mu);
    std::ostream& console = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    console << line << std::flush;
    if (s.mirror.is_open()) s.mirror << line << std::flush;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[log] dropped message (%s)\n", e.what());
  }
}

}  // namespace fleetopt
