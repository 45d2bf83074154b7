#pragma once
/*
================================================================================
Fragment 3.2 — Optimization: Fleet Binary Program (Exact Branch-and-Bound)
FILE: cpp/engine/optimization/fleet_program.hpp

Formulation (x_v in {0,1}, one per vessel, id order):
  CAPACITY      sum dwt_v x_v                 >= cargo_requirement_dwt
  SAFETY        sum (safety_v - floor) x_v    >= 0
  FUEL.<type>   sum_{fuel(v)=f} x_v           >= 1      for each required f
  SIZE          sum x_v  == N   (fixed)   /   <= N   (max)      optional
  COST_CEILING  sum cost_v x_v                <= C (+ relative 1e-9)   optional
  objective     min sum cost_v x_v    or    none (feasibility query)

Search:
  - Depth-first branch-and-bound with an explicit node stack. A node is a
    fix vector (free / 0 / 1) plus its parent's LP bound; nothing else is
    shared between nodes.
  - Node relaxations are solved by OR-tools MPSolver (GLOP). The model is
    built once per solve; fixed variables are set through column bounds.
  - Branch variable: largest fractionality, ties to the smallest vessel id.
    The x=1 child is explored first.
  - Prune when LP bound >= incumbent - optimality_abs_tol.
  - Integral LP points are re-checked with the feasibility model before
    they become the incumbent.

Outcomes:
  - Optimal     exhaustive search finished; certificate.search_exhausted
  - Feasible    feasibility query found a fleet (no objective)
  - Infeasible  constraint system has no integral solution (normal result)
  - NodeLimit   SolverSettings::node_limit reached; incumbent (if any) is
                returned with the proven lower bound, never labelled optimal

Determinism:
  - No randomness, no hash-ordered containers, no threads. GLOP is
    deterministic, so identical inputs and settings give the identical fleet.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/vessel.hpp"
#include "engine/selection/feasibility.hpp"
#include "engine/selection/fleet.hpp"

namespace fleetopt {

enum class ObjectiveKind : std::uint8_t { MinimizeCost = 0, FeasibilityOnly = 1 };

struct FleetProgram {
  ObjectiveKind objective = ObjectiveKind::MinimizeCost;
  std::optional<int> fixed_fleet_size;
  std::optional<int> max_fleet_size;
  std::optional<double> cost_ceiling;
  std::string label = "milp";

  static FleetProgram minimize_cost(std::string label) {
    FleetProgram p;
    p.label = std::move(label);
    return p;
  }
};

enum class SolveStatus : std::uint8_t { Optimal = 0, Feasible = 1, Infeasible = 2, NodeLimit = 3 };

inline const char* to_string(SolveStatus s) noexcept {
  switch (s) {
    case SolveStatus::Optimal:    return "Optimal";
    case SolveStatus::Feasible:   return "Feasible";
    case SolveStatus::Infeasible: return "Infeasible";
    case SolveStatus::NodeLimit:  return "NodeLimit";
    default:                      return "Unknown";
  }
}

struct SolveCertificate {
  std::uint64_t nodes_explored = 0;
  std::uint64_t pruned_by_bound = 0;
  std::uint64_t infeasible_nodes = 0;
  std::uint64_t lp_iterations = 0;
  double root_lower_bound = 0.0;
  double proven_lower_bound = 0.0;  // min over open nodes and incumbent
  double gap = 0.0;                 // incumbent - proven_lower_bound
  bool search_exhausted = false;
};

struct SolveResult {
  SolveStatus status = SolveStatus::Infeasible;
  std::optional<Fleet> fleet;
  FleetMetrics metrics;
  double objective_value = 0.0;
  SolveCertificate certificate;
  std::string label;
  double solve_seconds = 0.0;
  std::string message;

  bool has_fleet() const noexcept { return fleet.has_value(); }

  // Optimal/Feasible -> Ok, Infeasible -> InfeasibleScenario, NodeLimit -> NodeLimit.
  ResultCode code() const noexcept;
};

// Throws MalformedInputError for invalid scenario/settings/program shape and
// NumericalError if an LP relaxation breaks down. Infeasibility is returned.
SolveResult solve_fleet_program(const VesselTable& table,
                                const Scenario& scenario,
                                const FleetProgram& program,
                                const SolverSettings& settings = SolverSettings());

}  // namespace fleetopt
