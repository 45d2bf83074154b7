#include "engine/analysis/scenario_runner.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "engine/analysis/worker_pool.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_fingerprint.hpp"

namespace fleetopt::analysis {

namespace {

constexpr const char* kComponent = "analytics";
constexpr double kRelCostTol = 1e-9;

std::string fmt(double x, int prec) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(prec) << x;
  return o.str();
}

double cost_tol(double c) { return kRelCostTol * std::max(1.0, std::fabs(c)); }

// Solves each program against its own scenario on the worker pool.
std::vector<SolveResult> solve_all(const VesselTable& table,
                                   const std::vector<Scenario>& scenarios,
                                   const std::vector<FleetProgram>& programs,
                                   const RunSettings& settings) {
  std::vector<SolveResult> out(programs.size());
  run_slots(programs.size(), settings.workers, [&](std::size_t i) {
    out[i] = solve_fleet_program(table, scenarios[i], programs[i], settings.solver);
  });
  return out;
}

}  // namespace

AnalyticsRow to_row(const std::string& query, double parameter, const SolveResult& r) {
  AnalyticsRow row;
  row.query = query;
  row.label = r.label;
  row.parameter = parameter;
  row.status = r.status;
  row.feasible = r.has_fleet();
  row.solve_seconds = r.solve_seconds;
  row.nodes = r.certificate.nodes_explored;
  if (r.fleet) {
    row.total_cost = r.metrics.total_cost;
    row.avg_safety = r.metrics.avg_safety;
    row.fleet_size = r.metrics.size;
    row.total_dwt = r.metrics.total_dwt;
    row.total_co2_eq = r.metrics.total_co2_eq;
    row.total_fuel = r.metrics.total_fuel;
    row.fuel_types_present = r.metrics.fuel_type_count();
    row.fleet_ids = r.fleet->ids();
  }
  return row;
}

// ----------------------------- Fleet-size sweep ------------------------------

AnalyticsTable fleet_size_sweep(const VesselTable& table,
                                const Scenario& scenario,
                                int n_min,
                                int n_max,
                                const RunSettings& settings) {
  settings.validate_or_throw();
  FLEETOPT_REQUIRE(n_min >= 0 && n_min <= n_max, MalformedInputError,
                   "fleet_size_sweep: need 0 <= n_min <= n_max");

  std::vector<Scenario> scenarios;
  std::vector<FleetProgram> programs;
  for (int n = n_min; n <= n_max; ++n) {
    FleetProgram p = FleetProgram::minimize_cost("milp_fs" + std::to_string(n) + "_s" + fmt(scenario.safety_floor, 1));
    p.fixed_fleet_size = n;
    programs.push_back(std::move(p));
    scenarios.push_back(scenario);
  }

  log(LogLevel::INFO, kComponent,
      "fleet-size sweep N=" + std::to_string(n_min) + ".." + std::to_string(n_max) +
          " at safety >= " + fmt(scenario.safety_floor, 2));

  const auto results = solve_all(table, scenarios, programs, settings);
  AnalyticsTable out;
  for (std::size_t i = 0; i < results.size(); ++i) {
    out.push_back(to_row("fleet_size", static_cast<double>(n_min + static_cast<int>(i)), results[i]));
  }
  return out;
}

// ----------------------------- Pareto ----------------------------------------

std::string FleetSizeRule::name() const {
  switch (kind) {
    case FleetSizeRuleKind::Fixed: return "fixed_" + std::to_string(n);
    case FleetSizeRuleKind::Max:   return "max_" + std::to_string(n);
    default:                       return "unconstrained";
  }
}

AnalyticsTable pareto_frontier(const VesselTable& table,
                               const Scenario& scenario,
                               const std::vector<double>& thresholds,
                               FleetSizeRule rule,
                               const RunSettings& settings) {
  settings.validate_or_throw();

  std::vector<Scenario> scenarios;
  std::vector<FleetProgram> programs;
  for (double t : thresholds) {
    FleetProgram p = FleetProgram::minimize_cost("pareto_" + rule.name() + "_s" + fmt(t, 2));
    if (rule.kind == FleetSizeRuleKind::Fixed) p.fixed_fleet_size = rule.n;
    if (rule.kind == FleetSizeRuleKind::Max) p.max_fleet_size = rule.n;
    programs.push_back(std::move(p));
    scenarios.push_back(scenario.with_safety_floor(t));
  }

  log(LogLevel::INFO, kComponent,
      "pareto sweep [" + rule.name() + "] over " + std::to_string(thresholds.size()) + " thresholds");

  const auto results = solve_all(table, scenarios, programs, settings);
  AnalyticsTable out;
  for (std::size_t i = 0; i < results.size(); ++i) {
    out.push_back(to_row("pareto/" + rule.name(), thresholds[i], results[i]));
  }

  verify_frontier(out, rule);
  return out;
}

MonotonicityCheck verify_frontier(const AnalyticsTable& frontier, FleetSizeRule rule) {
  MonotonicityCheck mc = frontier_is_monotone(frontier);
  if (!mc.ok) log(LogLevel::ERROR, kComponent, "pareto [" + rule.name() + "]: " + mc.message);
  return mc;
}

MonotonicityCheck frontier_is_monotone(const AnalyticsTable& frontier) {
  MonotonicityCheck mc;
  bool have_cost = false;
  double last_cost = 0.0;
  bool seen_infeasible = false;
  double seen_at = 0.0;

  for (std::size_t i = 0; i < frontier.size(); ++i) {
    const AnalyticsRow& r = frontier[i];
    if (i > 0 && r.parameter < frontier[i - 1].parameter) {
      mc.ok = false;
      mc.message = "thresholds are not ascending at row " + std::to_string(i);
      return mc;
    }
    if (r.status == SolveStatus::NodeLimit) continue;

    if (!r.feasible) {
      if (!seen_infeasible) seen_at = r.parameter;
      seen_infeasible = true;
      continue;
    }
    if (seen_infeasible) {
      mc.ok = false;
      mc.message = "threshold " + fmt(r.parameter, 3) + " feasible after infeasible threshold " + fmt(seen_at, 3);
      return mc;
    }
    if (have_cost && r.total_cost < last_cost - cost_tol(last_cost)) {
      mc.ok = false;
      mc.message = "cost decreases at threshold " + fmt(r.parameter, 3) + " (" + fmt(r.total_cost, 2) +
                   " < " + fmt(last_cost, 2) + ")";
      return mc;
    }
    have_cost = true;
    last_cost = r.total_cost;
  }
  mc.message = "monotone";
  return mc;
}

// ----------------------------- Domination ------------------------------------

DominationResult domination_search(const VesselTable& table,
                                   const Scenario& scenario,
                                   const FleetMetrics& baseline,
                                   const RunSettings& settings,
                                   const DominationOptions& options) {
  settings.validate_or_throw();
  FLEETOPT_REQUIRE(options.step >= 0.01 && options.strict_probe > 0.0, MalformedInputError,
                   "domination_search: step must be >= 0.01 and strict_probe > 0");
  FLEETOPT_REQUIRE(baseline.size > 0, MalformedInputError, "domination_search: empty baseline fleet");

  DominationResult res;
  res.baseline_cost = baseline.total_cost;
  res.baseline_safety = baseline.avg_safety;
  const double c0 = baseline.total_cost;
  const double s0 = baseline.avg_safety;

  std::vector<double> params;
  params.push_back(s0);                          // same safety, cheaper?
  params.push_back(s0 + options.strict_probe);   // strictly safer, no dearer?
  for (int i = 1;; ++i) {
    const double t = std::round((s0 + options.step * i) * 100.0) / 100.0;
    if (t > options.max_threshold + 1e-9) break;
    params.push_back(t);
  }

  std::vector<Scenario> scenarios;
  std::vector<FleetProgram> programs;
  for (std::size_t i = 0; i < params.size(); ++i) {
    std::string label = (i == 0) ? "dominate_cost_probe"
                      : (i == 1) ? "dominate_strict_probe"
                                 : "dominate_s" + fmt(params[i], 2);
    FleetProgram p = FleetProgram::minimize_cost(std::move(label));
    p.cost_ceiling = c0;
    programs.push_back(std::move(p));
    scenarios.push_back(scenario.with_safety_floor(params[i]));
  }

  log(LogLevel::INFO, kComponent,
      "domination search vs baseline cost=" + fmt(c0, 2) + " safety=" + fmt(s0, 3) + " (" +
          std::to_string(params.size()) + " probes)");

  const auto results = solve_all(table, scenarios, programs, settings);
  for (std::size_t i = 0; i < results.size(); ++i) {
    res.probes.push_back(to_row("dominate", params[i], results[i]));
  }

  for (const auto& r : res.probes) {
    if (!r.feasible) continue;
    const bool safer = r.avg_safety > s0 + kSafetyTolerance && r.total_cost <= c0 + cost_tol(c0);
    const bool cheaper = r.avg_safety >= s0 - kSafetyTolerance && r.total_cost < c0 - cost_tol(c0);
    if (!(safer || cheaper)) continue;
    res.dominated = true;
    if (!res.best || r.parameter > res.best->parameter) res.best = r;
  }

  if (res.dominated) {
    res.verdict = "dominated: fleet with cost " + fmt(res.best->total_cost, 2) + " and safety " +
                  fmt(res.best->avg_safety, 3) + " beats baseline (" + fmt(c0, 2) + ", " + fmt(s0, 3) + ")";
  } else {
    res.verdict = "no dominating fleet: baseline is Pareto-efficient";
  }
  log(LogLevel::INFO, kComponent, res.verdict);
  return res;
}

// ----------------------------- Claim -----------------------------------------

bool ClaimVerdict::operator==(const ClaimVerdict& o) const {
  return claim.fleet_size == o.claim.fleet_size && claim.safety_floor == o.claim.safety_floor &&
         claim.cost_ceiling == o.claim.cost_ceiling && feasible == o.feasible &&
         claim_status == o.claim_status && best_cost_at_target == o.best_cost_at_target &&
         best_safety_at_target == o.best_safety_at_target && best_fleet_size == o.best_fleet_size &&
         gap_to_claim == o.gap_to_claim && gap_pct == o.gap_pct &&
         min_cost_any_size == o.min_cost_any_size && fleet_size_at_min_cost == o.fleet_size_at_min_cost &&
         safety_at_min_cost == o.safety_at_min_cost && note == o.note;
}

ClaimVerdict check_claim(const VesselTable& table,
                         const Scenario& scenario,
                         const Claim& claim,
                         const RunSettings& settings) {
  settings.validate_or_throw();
  FLEETOPT_REQUIRE(std::isfinite(claim.cost_ceiling), MalformedInputError, "check_claim: cost ceiling must be finite");

  const Scenario target = scenario.with_safety_floor(claim.safety_floor);

  FleetProgram exact;
  exact.objective = ObjectiveKind::FeasibilityOnly;
  exact.fixed_fleet_size = claim.fleet_size;
  exact.cost_ceiling = claim.cost_ceiling;
  exact.label = "claim_check_constrained";

  FleetProgram best = FleetProgram::minimize_cost("claim_check_best");
  best.fixed_fleet_size = claim.fleet_size;

  FleetProgram any = FleetProgram::minimize_cost("claim_check_any_size");

  log(LogLevel::INFO, kComponent,
      "claim check: fleet=" + std::to_string(claim.fleet_size) + " safety>=" + fmt(claim.safety_floor, 2) +
          " cost<=" + fmt(claim.cost_ceiling, 0));

  const auto r = solve_all(table, {target, target, target}, {exact, best, any}, settings);

  ClaimVerdict v;
  v.claim = claim;
  v.claim_status = r[0].status;
  v.feasible = r[0].has_fleet();

  if (r[1].has_fleet()) {
    v.best_cost_at_target = r[1].metrics.total_cost;
    v.best_safety_at_target = r[1].metrics.avg_safety;
    v.best_fleet_size = r[1].metrics.size;
    v.gap_to_claim = r[1].metrics.total_cost - claim.cost_ceiling;
    v.gap_pct = (claim.cost_ceiling != 0.0) ? v.gap_to_claim / claim.cost_ceiling * 100.0 : 0.0;
  } else {
    v.note = "infeasible even without cost ceiling at fleet size " + std::to_string(claim.fleet_size);
  }

  if (r[2].has_fleet()) {
    v.min_cost_any_size = r[2].metrics.total_cost;
    v.fleet_size_at_min_cost = r[2].metrics.size;
    v.safety_at_min_cost = r[2].metrics.avg_safety;
  }

  log(LogLevel::INFO, kComponent,
      std::string("claim verdict: ") + (v.feasible ? "FEASIBLE" : "INFEASIBLE") +
          (v.best_cost_at_target ? "; best cost at target " + fmt(*v.best_cost_at_target, 2) +
                                       " (gap " + fmt(v.gap_pct, 1) + "%)"
                                 : std::string()));
  return v;
}

// ----------------------------- Marginal cost ---------------------------------

namespace {

std::vector<MarginalRow> marginal(const AnalyticsTable& rows, const char* axis) {
  std::vector<MarginalRow> out;
  const AnalyticsRow* prev = nullptr;
  for (const auto& r : rows) {
    if (!r.feasible) continue;
    if (prev && r.parameter != prev->parameter) {
      MarginalRow m;
      m.axis = axis;
      m.from = prev->parameter;
      m.to = r.parameter;
      m.cost_from = prev->total_cost;
      m.cost_to = r.total_cost;
      m.delta_cost = r.total_cost - prev->total_cost;
      m.per_unit = m.delta_cost / (m.to - m.from);
      out.push_back(std::move(m));
    }
    prev = &r;
  }
  return out;
}

}  // namespace

std::vector<MarginalRow> marginal_cost_per_safety(const AnalyticsTable& frontier) {
  return marginal(frontier, "safety");
}

std::vector<MarginalRow> marginal_cost_per_vessel(const AnalyticsTable& size_sweep) {
  return marginal(size_sweep, "fleet_size");
}

// ----------------------------- Heuristic gap ---------------------------------

std::optional<HeuristicGap> heuristic_gap(const GreedyResult& greedy, const SolveResult& optimal) {
  if (!greedy.fleet || !optimal.fleet) return std::nullopt;
  HeuristicGap g;
  g.greedy_cost = greedy.metrics.total_cost;
  g.optimal_cost = optimal.metrics.total_cost;
  g.savings = g.greedy_cost - g.optimal_cost;
  g.savings_pct = (g.greedy_cost != 0.0) ? g.savings / g.greedy_cost * 100.0 : 0.0;
  return g;
}

// ----------------------------- Sensitivity -----------------------------------

std::vector<Scenario> default_sensitivity_scenarios(const Scenario& base) {
  return {
      base.with_label("base"),
      base.with_label("safety_4.0").with_safety_floor(4.0),
      base.with_label("carbon_2x").with_carbon_price(base.carbon_price_usd_per_t * 2.0),
  };
}

std::vector<SensitivityRow> run_sensitivity(const VesselMetricsProvider& provider,
                                            const std::vector<Scenario>& scenarios,
                                            const RunSettings& settings) {
  settings.validate_or_throw();

  std::vector<SensitivityRow> out(scenarios.size());
  run_slots(scenarios.size(), settings.workers, [&](std::size_t i) {
    const Scenario& s = scenarios[i];
    const VesselTable table = provider.vessels_for(s);

    SensitivityRow row;
    row.label = s.label;
    row.safety_floor = s.safety_floor;
    row.carbon_price = s.carbon_price_usd_per_t;
    row.input_fingerprint = run_input_fingerprint_hex(table, s);

    const GreedyResult g = select_greedy(table, s);
    row.greedy_status = g.status;
    row.greedy_has_fleet = g.fleet.has_value();
    row.greedy = g.metrics;

    const SolveResult opt = solve_fleet_program(table, s, FleetProgram::minimize_cost("sensitivity_" + s.label),
                                                settings.solver);
    row.optimal_status = opt.status;
    row.optimal_has_fleet = opt.has_fleet();
    row.optimal = opt.metrics;
    row.gap = heuristic_gap(g, opt);

    out[i] = std::move(row);
  });

  for (const auto& r : out) {
    log(LogLevel::INFO, kComponent,
        "sensitivity [" + r.label + "] greedy=" + std::string(to_string(r.greedy_status)) +
            (r.greedy_has_fleet ? " cost=" + fmt(r.greedy.total_cost, 2) : std::string()) +
            " optimal=" + to_string(r.optimal_status) +
            (r.optimal_has_fleet ? " cost=" + fmt(r.optimal.total_cost, 2) : std::string()));
  }
  return out;
}

}  // namespace fleetopt::analysis
