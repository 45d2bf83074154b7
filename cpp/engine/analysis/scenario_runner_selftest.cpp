/*
  Fragment 4.3 — Analytics Runner Selftest

  Objective
  ---------
  Framework-free checks for every analytics query on a ten-vessel fixture
  whose optima were verified by exhaustive enumeration:
    1) Fleet-size sweep and marginal cost per vessel.
    2) Pareto frontier: costs, infeasible tail, monotonicity, marginal cost
       per safety point; the monotonicity checker flags broken frontiers.
    3) Domination search: dominated and Pareto-efficient baselines.
    4) Claim check: infeasible and feasible claims, repeat runs identical.
    5) Heuristic gap and the sensitivity batch.
    6) workers=4 reproduces workers=1 row for row.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./scenario_runner_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "engine/analysis/scenario_runner.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/provider/vessel_provider.hpp"
#include "engine/selection/greedy_selector.hpp"

namespace fleetopt::analysis {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, std::string_view msg) {
  if (!(std::fabs(got - exp) <= 1e-6)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

Vessel make_vessel(VesselId id, double dwt, FuelType fuel, double safety, double cost) {
  Vessel v;
  v.id = id;
  v.dwt = dwt;
  v.main_fuel_type = fuel;
  v.safety_score = safety;
  v.adjusted_cost = cost;
  return v;
}

VesselTable ten_vessel_table() {
  const FuelType A = FuelType::Distillate;
  const FuelType B = FuelType::Lng;
  return VesselTable({make_vessel(1, 20, A, 3, 100), make_vessel(2, 20, A, 4, 120), make_vessel(3, 20, A, 3, 140),
                      make_vessel(4, 20, A, 5, 200), make_vessel(5, 20, A, 2, 300), make_vessel(6, 15, B, 3, 60),
                      make_vessel(7, 15, B, 4, 75),  make_vessel(8, 15, B, 2, 90),  make_vessel(9, 15, B, 3, 120),
                      make_vessel(10, 15, B, 4, 180)});
}

Scenario fixture_scenario(double cargo = 100.0) {
  Scenario s;
  s.label = "fixture";
  s.safety_floor = 3.0;
  s.cargo_requirement_dwt = cargo;
  s.required_fuel_types = fuel_set_of({FuelType::Distillate, FuelType::Lng});
  return s;
}

std::vector<double> thresholds_3_to_5() {
  std::vector<double> t;
  for (int i = 0; i <= 10; ++i) t.push_back(3.0 + 0.2 * i);
  return t;
}

bool same_rows(const AnalyticsTable& a, const AnalyticsTable& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].label != b[i].label || a[i].status != b[i].status || a[i].total_cost != b[i].total_cost ||
        a[i].fleet_ids != b[i].fleet_ids || a[i].nodes != b[i].nodes) {
      return false;
    }
  }
  return true;
}

void test_size_sweep() {
  const AnalyticsTable rows = fleet_size_sweep(ten_vessel_table(), fixture_scenario(), 4, 8, RunSettings::defaults());
  expect_true(rows.size() == 5, "Sweep: one row per size");
  expect_true(!rows[0].feasible && !rows[1].feasible, "Sweep: N=4,5 infeasible");
  expect_true(rows[2].feasible && rows[2].fleet_size == 6, "Sweep: N=6 feasible");
  expect_near(rows[2].total_cost, 565.0, "Sweep: N=6 cost");
  expect_near(rows[3].total_cost, 705.0, "Sweep: N=7 cost");
  expect_near(rows[4].total_cost, 885.0, "Sweep: N=8 cost");
  expect_true(rows[2].query == "fleet_size" && rows[2].label == "milp_fs6_s3.0", "Sweep: query and label");

  const auto marg = marginal_cost_per_vessel(rows);
  expect_true(marg.size() == 2, "Sweep: marginal rows skip infeasible sizes");
  if (marg.size() == 2) {
    expect_near(marg[0].per_unit, 140.0, "Sweep: marginal cost 6->7");
    expect_near(marg[1].per_unit, 180.0, "Sweep: marginal cost 7->8");
  }
}

void test_pareto() {
  const AnalyticsTable f = pareto_frontier(ten_vessel_table(), fixture_scenario(), thresholds_3_to_5(),
                                           FleetSizeRule::unconstrained(), RunSettings::defaults());
  expect_true(f.size() == 11, "Pareto: one row per threshold");
  const double costs[] = {565.0, 615.0, 645.0, 675.0, 735.0};
  for (int i = 0; i < 5; ++i) {
    expect_true(f[i].feasible, "Pareto: feasible below 4.0");
    expect_near(f[i].total_cost, costs[i], "Pareto: frontier cost");
  }
  bool tail_infeasible = true;
  for (std::size_t i = 5; i < f.size(); ++i) tail_infeasible = tail_infeasible && !f[i].feasible;
  expect_true(tail_infeasible, "Pareto: infeasible from 4.0 on");
  expect_true(f[0].query == "pareto/unconstrained", "Pareto: query names size rule");

  const MonotonicityCheck mc = frontier_is_monotone(f);
  expect_true(mc.ok && mc.message == "monotone", "Pareto: frontier monotone");

  const auto marg = marginal_cost_per_safety(f);
  expect_true(marg.size() == 4, "Pareto: marginal rows between feasible points");
  if (marg.size() == 4) {
    expect_near(marg[0].per_unit, 250.0, "Pareto: marginal 3.0->3.2");
    expect_near(marg[3].per_unit, 300.0, "Pareto: marginal 3.6->3.8");
  }

  AnalyticsTable broken = f;
  broken[1].total_cost = 500.0;
  expect_true(!frontier_is_monotone(broken).ok, "Monotone: cost drop flagged");

  AnalyticsTable revived = f;
  revived[6].feasible = true;
  revived[6].status = SolveStatus::Optimal;
  revived[6].total_cost = 900.0;
  expect_true(!frontier_is_monotone(revived).ok, "Monotone: feasible after infeasible flagged");

  // A broken frontier is reported at ERROR under its size rule.
  const std::filesystem::path log_path = std::filesystem::temp_directory_path() / "fleetopt_selftest_frontier.log";
  expect_true(fleetopt::set_log_file(log_path.string()), "Monotone: log mirror opened");
  const MonotonicityCheck vb = verify_frontier(broken, FleetSizeRule::fixed(6));
  fleetopt::close_log_file();
  std::ifstream ifs(log_path);
  const std::string logged((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  expect_true(!vb.ok, "Monotone: verify_frontier flags the cost drop");
  expect_true(logged.find("[ERROR] analytics: pareto [fixed_6]") != std::string::npos,
              "Monotone: violation logged at ERROR");

  const AnalyticsTable fixed6 = pareto_frontier(ten_vessel_table(), fixture_scenario(), {3.0},
                                                FleetSizeRule::fixed(6), RunSettings::defaults());
  expect_true(fixed6.size() == 1 && fixed6[0].fleet_size == 6 && fixed6[0].query == "pareto/fixed_6",
              "Pareto: fixed size rule applied");
}

void test_domination() {
  const VesselTable t = ten_vessel_table();
  const GreedyResult g = select_greedy(t, fixture_scenario());
  const DominationResult d = domination_search(t, fixture_scenario(), g.metrics, RunSettings::defaults());

  expect_near(d.baseline_cost, 585.0, "Dominate: baseline cost");
  expect_true(d.probes.size() == 20, "Dominate: cost probe, strict probe and 18 grid points");
  expect_true(d.dominated, "Dominate: greedy fleet dominated");
  expect_true(d.best.has_value() && std::fabs(d.best->total_cost - 565.0) < 1e-6,
              "Dominate: cheaper fleet at equal safety");
  expect_true(!d.probes[1].feasible, "Dominate: no strictly safer fleet under 585");

  // Four 10 t vessels, 30 t needed; greedy takes ids 1..3 at safety 3.0.
  const FuelType A = FuelType::Distillate;
  const FuelType B = FuelType::Lng;
  const VesselTable small({make_vessel(1, 10, A, 3, 10), make_vessel(2, 10, B, 3, 10), make_vessel(3, 10, A, 3, 10),
                           make_vessel(4, 10, B, 5, 10)});
  const Scenario s30 = fixture_scenario(30.0);
  const GreedyResult gs = select_greedy(small, s30);
  expect_true(gs.fleet && gs.fleet->ids() == std::vector<VesselId>({1, 2, 3}), "Dominate: small greedy fleet");

  const DominationResult ds = domination_search(small, s30, gs.metrics, RunSettings::defaults());
  expect_true(ds.probes.size() == 22, "Dominate: grid reaches 5.0");
  expect_true(ds.dominated && ds.best.has_value(), "Dominate: safer fleet at equal cost");
  if (ds.best) {
    expect_near(ds.best->parameter, 3.6, "Dominate: highest feasible threshold");
    expect_near(ds.best->avg_safety, 11.0 / 3.0, "Dominate: dominating fleet safety");
    expect_near(ds.best->total_cost, 30.0, "Dominate: dominating fleet cost");
  }

  const VesselTable flat({make_vessel(1, 10, A, 3, 10), make_vessel(2, 10, B, 3, 10), make_vessel(3, 10, A, 3, 10),
                          make_vessel(4, 10, B, 3, 10)});
  const GreedyResult gf = select_greedy(flat, s30);
  const DominationResult df = domination_search(flat, s30, gf.metrics, RunSettings::defaults());
  expect_true(!df.dominated && !df.best, "Dominate: efficient baseline not dominated");

  // Grid points are rounded to 2 decimals; finer steps would repeat them.
  DominationOptions fine;
  fine.step = 0.005;
  bool rejected = false;
  try {
    (void)domination_search(small, s30, gs.metrics, RunSettings::defaults(), fine);
  } catch (const fleetopt::MalformedInputError&) {
    rejected = true;
  }
  expect_true(rejected, "Dominate: step below 0.01 rejected");

  DominationOptions hundredth;
  hundredth.step = 0.01;
  hundredth.max_threshold = 3.05;
  const DominationResult dh = domination_search(small, s30, gs.metrics, RunSettings::defaults(), hundredth);
  bool ascending = dh.probes.size() == 7;
  for (std::size_t i = 2; ascending && i < dh.probes.size(); ++i) {
    ascending = dh.probes[i].parameter > dh.probes[i - 1].parameter;
  }
  expect_true(ascending, "Dominate: 0.01 grid above the baseline, no repeats");
}

void test_claim() {
  const VesselTable t = ten_vessel_table();
  Claim c;
  c.fleet_size = 6;
  c.safety_floor = 3.0;
  c.cost_ceiling = 560.0;

  const ClaimVerdict v = check_claim(t, fixture_scenario(), c, RunSettings::defaults());
  expect_true(!v.feasible && v.claim_status == SolveStatus::Infeasible, "Claim: 560 infeasible");
  expect_true(v.best_cost_at_target.has_value() && std::fabs(*v.best_cost_at_target - 565.0) < 1e-6,
              "Claim: best cost at target");
  expect_near(v.gap_to_claim, 5.0, "Claim: gap to ceiling");
  expect_near(v.gap_pct, 5.0 / 560.0 * 100.0, "Claim: gap percent");
  expect_true(v.min_cost_any_size.has_value() && v.fleet_size_at_min_cost == 6, "Claim: any-size optimum");

  const ClaimVerdict again = check_claim(t, fixture_scenario(), c, RunSettings::defaults());
  expect_true(v == again, "Claim: repeat run identical");

  c.cost_ceiling = 600.0;
  const ClaimVerdict ok = check_claim(t, fixture_scenario(), c, RunSettings::defaults());
  expect_true(ok.feasible && ok.claim_status == SolveStatus::Feasible, "Claim: 600 feasible");

  c.fleet_size = 4;
  const ClaimVerdict none = check_claim(t, fixture_scenario(), c, RunSettings::defaults());
  expect_true(!none.feasible && !none.best_cost_at_target && !none.note.empty(), "Claim: impossible size noted");
}

void test_gap_and_sensitivity() {
  const VesselTable t = ten_vessel_table();
  const GreedyResult g = select_greedy(t, fixture_scenario());
  const SolveResult opt = solve_fleet_program(t, fixture_scenario(), FleetProgram::minimize_cost("opt"));
  const auto gap = heuristic_gap(g, opt);
  expect_true(gap.has_value(), "Gap: both fleets present");
  if (gap) {
    expect_near(gap->savings, 20.0, "Gap: savings");
    expect_near(gap->savings_pct, 20.0 / 585.0 * 100.0, "Gap: savings percent");
  }

  const StaticVesselProvider provider(t);
  const auto scenarios = default_sensitivity_scenarios(fixture_scenario());
  expect_true(scenarios.size() == 3 && scenarios[1].label == "safety_4.0" && scenarios[2].label == "carbon_2x",
              "Sensitivity: default scenarios");

  RunSettings rs = RunSettings::defaults();
  rs.workers = 3;
  const auto rows = run_sensitivity(provider, scenarios, rs);
  expect_true(rows.size() == 3, "Sensitivity: one row per scenario");
  expect_true(rows[0].gap.has_value() && std::fabs(rows[0].gap->savings - 20.0) < 1e-6, "Sensitivity: base gap");
  expect_true(rows[1].greedy_status == ResultCode::ConstraintUnsatisfied && rows[1].greedy_has_fleet,
              "Sensitivity: greedy misses floor 4.0");
  expect_true(rows[1].optimal_status == SolveStatus::Infeasible && !rows[1].gap, "Sensitivity: floor 4.0 infeasible");
  expect_near(rows[2].carbon_price, 160.0, "Sensitivity: carbon doubled");
  expect_true(rows[0].input_fingerprint != rows[2].input_fingerprint, "Sensitivity: fingerprint tracks scenario");
}

void test_parallel_matches_sequential() {
  RunSettings one = RunSettings::defaults();
  RunSettings four = RunSettings::defaults();
  four.workers = 4;

  const VesselTable t = ten_vessel_table();
  const AnalyticsTable a = pareto_frontier(t, fixture_scenario(), thresholds_3_to_5(), FleetSizeRule::unconstrained(), one);
  const AnalyticsTable b = pareto_frontier(t, fixture_scenario(), thresholds_3_to_5(), FleetSizeRule::unconstrained(), four);
  expect_true(same_rows(a, b), "Parallel: pareto rows identical");

  const AnalyticsTable c = fleet_size_sweep(t, fixture_scenario(), 1, 10, one);
  const AnalyticsTable d = fleet_size_sweep(t, fixture_scenario(), 1, 10, four);
  expect_true(same_rows(c, d), "Parallel: size sweep rows identical");
}

}  // namespace
}  // namespace fleetopt::analysis

int main() {
  using namespace fleetopt::analysis;
  fleetopt::set_log_level(fleetopt::LogLevel::ERROR);

  test_size_sweep();
  test_pareto();
  test_domination();
  test_claim();
  test_gap_and_sensitivity();
  test_parallel_matches_sequential();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
