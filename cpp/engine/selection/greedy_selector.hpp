#pragma once
/*
================================================================================
Fragment 2.3 — Selection: Greedy Two-Phase Selector (Deterministic)
FILE: cpp/engine/selection/greedy_selector.hpp

Algorithm:
  Phase 1 SEED   For each required fuel type (enum order), take the vessel
                 of that type with the lowest cost_per_dwt.
  Phase 2 FILL   From the remaining vessels, add in ascending cost_per_dwt
                 until total DWT >= cargo requirement.
  Validate       Evaluate all hard constraints on the final fleet.

Ordering:
  - Total order is (cost_per_dwt, vessel id). Equal cost_per_dwt never
    depends on input row order.

Outcomes (GreedyResult::status):
  - Ok                     fleet satisfies every constraint
  - InfeasibleScenario     a required fuel type has no vessel, or the pool
                           ran out before reaching the DWT requirement.
                           No fleet is returned.
  - ConstraintUnsatisfied  fleet was built but misses the safety floor.
                           Safety is NOT enforced while filling; the fleet
                           and its report are returned so the caller can
                           fall back to the exact optimizer.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/vessel.hpp"
#include "engine/selection/feasibility.hpp"
#include "engine/selection/fleet.hpp"

namespace fleetopt {

struct GreedyResult {
  ResultCode status = ResultCode::Ok;
  std::optional<Fleet> fleet;
  FleetMetrics metrics;
  std::vector<SelectionEntry> log;  // in selection order
  FeasibilityReport report;
  std::string message;

  bool ok() const noexcept { return status == ResultCode::Ok; }
};

// Validates the scenario (MalformedInputError) before any selection.
GreedyResult select_greedy(const VesselTable& table, const Scenario& scenario);

}  // namespace fleetopt
