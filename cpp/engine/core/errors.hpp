#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Types + Result Codes (Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Exceptions for faults that must stop a run before any search begins:
      * malformed vessel tables / scenarios / options
      * numerical breakdown inside the LP relaxation
      * CSV I/O failures
  - Result codes for NORMAL outcomes (infeasible scenario, greedy constraint
    miss, node limit). These are returned in result structs, never thrown.

Hardening:
  - Small, dependency-free exceptions.
  - FLEETOPT_REQUIRE attaches file:line so failures are searchable.
================================================================================
*/

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace fleetopt {

// Base error for the engine.
class FleetError : public std::runtime_error {
 public:
  explicit FleetError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Vessel table, scenario or option failed validation.
class MalformedInputError : public FleetError {
 public:
  explicit MalformedInputError(std::string msg) : FleetError(std::move(msg)) {}
};

// LP relaxation broke down (iteration cap, unbounded ray on a bounded model).
class NumericalError : public FleetError {
 public:
  explicit NumericalError(std::string msg) : FleetError(std::move(msg)) {}
};

// File system / stream failures.
class IOError : public FleetError {
 public:
  explicit IOError(std::string msg) : FleetError(std::move(msg)) {}
};

// Outcome of a selection or solve. Stable values (exported to CSV).
enum class ResultCode : std::uint8_t {
  Ok = 0,
  InfeasibleScenario = 1,     // no fleet of the requested shape exists
  ConstraintUnsatisfied = 2,  // greedy fleet misses a constraint it does not enforce
  NodeLimit = 3               // search stopped early; incumbent is not proven optimal
};

inline const char* to_string(ResultCode c) noexcept {
  switch (c) {
    case ResultCode::Ok:                    return "Ok";
    case ResultCode::InfeasibleScenario:    return "InfeasibleScenario";
    case ResultCode::ConstraintUnsatisfied: return "ConstraintUnsatisfied";
    case ResultCode::NodeLimit:             return "NodeLimit";
    default:                                return "Unknown";
  }
}

namespace detail {

template <class E>
[[noreturn]] inline void throw_at(const std::string& msg, const char* file, int line) {
  std::string what = msg;
  if (file && *file) {
    what += " @ ";
    what += file;
    what += ":";
    what += std::to_string(line);
  }
  throw E(std::move(what));
}

}  // namespace detail

}  // namespace fleetopt

#define FLEETOPT_THROW(TYPE, MSG) ::fleetopt::detail::throw_at<TYPE>((MSG), __FILE__, __LINE__)
#define FLEETOPT_REQUIRE(EXPR, TYPE, MSG)  \
  do {                                     \
    if (!(EXPR)) FLEETOPT_THROW(TYPE, MSG); \
  } while (0)
