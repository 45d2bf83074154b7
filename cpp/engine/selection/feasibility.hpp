#pragma once
/*
================================================================================
Fragment 2.2 — Selection: Feasibility Model (Metrics + Constraint Checks)
FILE: cpp/engine/selection/feasibility.hpp

Purpose:
  - Pure metric functions over a candidate fleet:
      total_dwt, avg_safety (unweighted mean), fuel_coverage, total_cost,
      plus informational CO2-eq and fuel totals.
  - Hard-constraint evaluation with stable check ids:
      CAPACITY.MIN_DWT    total_dwt   >= cargo_requirement_dwt
      SAFETY.MIN_AVG      avg_safety  >= safety_floor
      FUEL.COVERAGE       coverage    ⊇  required_fuel_types
  - Shared by the greedy selector, the exact optimizer (final check of each
    integral incumbent) and the analytics runner.

Notes:
  - Empty fleet: every sum is 0 and avg_safety is reported as 0.
  - The safety check allows kSafetyTolerance below the floor so that a mean
    that equals the floor mathematically is not rejected by rounding
    (e.g. (3+4+2)/3 vs 3.0).
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "engine/core/fuel_type.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/vessel.hpp"
#include "engine/selection/fleet.hpp"

namespace fleetopt {

inline constexpr double kSafetyTolerance = 1e-9;

struct FleetMetrics {
  std::size_t size = 0;
  double total_dwt = 0.0;
  double avg_safety = 0.0;
  double total_cost = 0.0;
  FuelSet fuel_coverage;
  double total_co2_eq = 0.0;
  double total_fuel = 0.0;

  std::size_t fuel_type_count() const noexcept { return fuel_coverage.count(); }
};

FleetMetrics compute_metrics(const VesselTable& table, const Fleet& fleet);

// Index-based variant for the optimizer hot path (no Fleet construction).
FleetMetrics compute_metrics(const VesselTable& table, const std::vector<std::size_t>& indices);

struct ConstraintCheck {
  std::string constraint_id;
  bool pass = false;
  double value = 0.0;
  double threshold = 0.0;
  std::string message;
};

struct FeasibilityReport {
  FleetMetrics metrics;
  std::vector<ConstraintCheck> checks;
  FuelSet missing_fuels;

  bool feasible() const noexcept {
    for (const auto& c : checks) {
      if (!c.pass) return false;
    }
    return true;
  }

  // "CAPACITY.MIN_DWT=PASS SAFETY.MIN_AVG=FAIL(average safety 2.800 < 3.000) ..."
  std::string summary() const;
};

FeasibilityReport evaluate_feasibility(const VesselTable& table,
                                       const Scenario& scenario,
                                       const Fleet& fleet);

FeasibilityReport evaluate_feasibility(const VesselTable& table,
                                       const Scenario& scenario,
                                       const FleetMetrics& metrics);

inline bool is_feasible(const VesselTable& table, const Scenario& scenario, const Fleet& fleet) {
  return evaluate_feasibility(table, scenario, fleet).feasible();
}

}  // namespace fleetopt
