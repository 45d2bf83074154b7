#pragma once
/*
================================================================================
Fragment 4.2 — Analysis: Scenario & Analytics Runner
FILE: cpp/engine/analysis/scenario_runner.hpp

Purpose:
  - Build comparative analytics from repeated, independent calls of the
    exact optimizer (and, for heuristic gap / sensitivity, the greedy
    selector):
      * fleet-size sweep           min cost for each fixed N
      * Pareto frontier            min cost for each safety threshold
      * domination search          can a fleet beat a baseline on both axes?
      * claim check                is (size, safety, cost ceiling) attainable?
      * marginal cost              delta cost per safety unit / per vessel
      * heuristic gap              greedy vs optimal savings
      * sensitivity                base / safety 4.0 / carbon x2 via a provider
  - The runner keeps no state between calls; every query returns its own
    table. Independent solves run on RunSettings::workers threads through
    run_slots(), and results are identical to a sequential run.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/scenario.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/vessel.hpp"
#include "engine/optimization/fleet_program.hpp"
#include "engine/provider/vessel_provider.hpp"
#include "engine/selection/greedy_selector.hpp"

namespace fleetopt::analysis {

// One optimizer call, flattened for reports.
struct AnalyticsRow {
  std::string query;      // "fleet_size", "pareto/unconstrained", "dominate", ...
  std::string label;      // optimizer run label
  double parameter = 0.0; // N, safety threshold, ...
  bool feasible = false;  // a fleet was returned
  SolveStatus status = SolveStatus::Infeasible;
  double total_cost = 0.0;
  double avg_safety = 0.0;
  std::size_t fleet_size = 0;
  double total_dwt = 0.0;
  double total_co2_eq = 0.0;
  double total_fuel = 0.0;
  std::size_t fuel_types_present = 0;
  double solve_seconds = 0.0;
  std::uint64_t nodes = 0;
  std::vector<VesselId> fleet_ids;
};

using AnalyticsTable = std::vector<AnalyticsRow>;

AnalyticsRow to_row(const std::string& query, double parameter, const SolveResult& r);

// ---------------------------------------------------------------------------
// Fleet-size sweep: sum x = N for N in [n_min, n_max].
AnalyticsTable fleet_size_sweep(const VesselTable& table,
                                const Scenario& scenario,
                                int n_min,
                                int n_max,
                                const RunSettings& settings);

// ---------------------------------------------------------------------------
// Pareto frontier.
enum class FleetSizeRuleKind : std::uint8_t { Unconstrained = 0, Fixed = 1, Max = 2 };

struct FleetSizeRule {
  FleetSizeRuleKind kind = FleetSizeRuleKind::Unconstrained;
  int n = 0;

  static FleetSizeRule unconstrained() { return FleetSizeRule{}; }
  static FleetSizeRule fixed(int n) { return FleetSizeRule{FleetSizeRuleKind::Fixed, n}; }
  static FleetSizeRule at_most(int n) { return FleetSizeRule{FleetSizeRuleKind::Max, n}; }

  std::string name() const;  // "unconstrained", "fixed_22", "max_22"
};

// Rows in the order of `thresholds` (callers pass them ascending).
AnalyticsTable pareto_frontier(const VesselTable& table,
                               const Scenario& scenario,
                               const std::vector<double>& thresholds,
                               FleetSizeRule rule,
                               const RunSettings& settings);

struct MonotonicityCheck {
  bool ok = true;
  std::string message;
};

// Over rows with ascending parameter: feasible costs non-decreasing, and
// no feasible row after an infeasible one. NodeLimit rows are skipped.
MonotonicityCheck frontier_is_monotone(const AnalyticsTable& frontier);

// frontier_is_monotone(), logging a violation at ERROR under the rule's name.
MonotonicityCheck verify_frontier(const AnalyticsTable& frontier, FleetSizeRule rule);

// ---------------------------------------------------------------------------
// Domination search against a baseline fleet (cost C0, safety S0).
struct DominationOptions {
  double step = 0.1;            // >= 0.01, the grid is rounded to 2 decimals
  double max_threshold = 5.0;
  double strict_probe = 1e-6;  // first safety probe is S0 + strict_probe
};

struct DominationResult {
  double baseline_cost = 0.0;
  double baseline_safety = 0.0;
  AnalyticsTable probes;               // cost probe, strict probe, then the grid
  bool dominated = false;
  std::optional<AnalyticsRow> best;    // highest feasible threshold under C0
  std::string verdict;
};

DominationResult domination_search(const VesselTable& table,
                                   const Scenario& scenario,
                                   const FleetMetrics& baseline,
                                   const RunSettings& settings,
                                   const DominationOptions& options = DominationOptions());

// ---------------------------------------------------------------------------
// Third-party claim check.
struct Claim {
  int fleet_size = 22;
  double safety_floor = 4.0;
  double cost_ceiling = 20'300'000.0;
};

struct ClaimVerdict {
  Claim claim;
  bool feasible = false;
  SolveStatus claim_status = SolveStatus::Infeasible;

  std::optional<double> best_cost_at_target;   // size + safety, no ceiling
  double best_safety_at_target = 0.0;
  std::size_t best_fleet_size = 0;
  double gap_to_claim = 0.0;                   // best_cost - ceiling
  double gap_pct = 0.0;

  std::optional<double> min_cost_any_size;     // safety only
  std::size_t fleet_size_at_min_cost = 0;
  double safety_at_min_cost = 0.0;

  std::string note;

  bool operator==(const ClaimVerdict& o) const;
};

ClaimVerdict check_claim(const VesselTable& table,
                         const Scenario& scenario,
                         const Claim& claim,
                         const RunSettings& settings);

// ---------------------------------------------------------------------------
// Marginal cost between consecutive feasible points.
struct MarginalRow {
  std::string axis;        // "safety" | "fleet_size"
  double from = 0.0;
  double to = 0.0;
  double cost_from = 0.0;
  double cost_to = 0.0;
  double delta_cost = 0.0;
  double per_unit = 0.0;   // delta_cost / (to - from)
};

std::vector<MarginalRow> marginal_cost_per_safety(const AnalyticsTable& frontier);
std::vector<MarginalRow> marginal_cost_per_vessel(const AnalyticsTable& size_sweep);

// ---------------------------------------------------------------------------
struct HeuristicGap {
  double greedy_cost = 0.0;
  double optimal_cost = 0.0;
  double savings = 0.0;
  double savings_pct = 0.0;
};

// nullopt unless both runs produced a fleet.
std::optional<HeuristicGap> heuristic_gap(const GreedyResult& greedy, const SolveResult& optimal);

// ---------------------------------------------------------------------------
// Sensitivity: one full greedy + optimal run per scenario.
struct SensitivityRow {
  std::string label;
  double safety_floor = 0.0;
  double carbon_price = 0.0;

  ResultCode greedy_status = ResultCode::Ok;
  bool greedy_has_fleet = false;
  FleetMetrics greedy;

  SolveStatus optimal_status = SolveStatus::Infeasible;
  bool optimal_has_fleet = false;
  FleetMetrics optimal;

  std::optional<HeuristicGap> gap;
  std::string input_fingerprint;
};

// base, "safety_4.0" (floor 4.0), "carbon_2x" (carbon price doubled).
std::vector<Scenario> default_sensitivity_scenarios(const Scenario& base);

std::vector<SensitivityRow> run_sensitivity(const VesselMetricsProvider& provider,
                                            const std::vector<Scenario>& scenarios,
                                            const RunSettings& settings);

}  // namespace fleetopt::analysis
