/*
  Fragment 2.4 — Selection Selftest (Fleet, Feasibility Model, Greedy Selector)

  Objective
  ---------
  Framework-free checks that pin the selection layer to hand-verified fixtures:
    1) Fleet rejects unknown / duplicate ids and stays sorted.
    2) Metrics and constraint checks (empty fleet, missing fuels, tolerance).
    3) Greedy selector: exact seed / fill order on a ten-vessel fixture,
       tie-break by vessel id, determinism under shuffled input, and the
       InfeasibleScenario / ConstraintUnsatisfied outcomes.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./selection_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/vessel.hpp"
#include "engine/selection/feasibility.hpp"
#include "engine/selection/fleet.hpp"
#include "engine/selection/greedy_selector.hpp"

namespace fleetopt {
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

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

void expect_ids(const std::vector<VesselId>& got, const std::vector<VesselId>& exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  got:";
    for (VesselId id : got) std::cerr << ' ' << id;
    std::cerr << "\n  exp:";
    for (VesselId id : exp) std::cerr << ' ' << id;
    std::cerr << "\n";
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
  v.co2_eq = dwt * 0.5;
  v.fuel_total = dwt * 0.1;
  return v;
}

// Five distillate vessels (20 t) and five LNG vessels (15 t).
std::vector<Vessel> ten_vessel_rows() {
  const FuelType A = FuelType::Distillate;
  const FuelType B = FuelType::Lng;
  return {make_vessel(1, 20, A, 3, 100), make_vessel(2, 20, A, 4, 120), make_vessel(3, 20, A, 3, 140),
          make_vessel(4, 20, A, 5, 200), make_vessel(5, 20, A, 2, 300), make_vessel(6, 15, B, 3, 60),
          make_vessel(7, 15, B, 4, 75),  make_vessel(8, 15, B, 2, 90),  make_vessel(9, 15, B, 3, 120),
          make_vessel(10, 15, B, 4, 180)};
}

Scenario two_fuel_scenario(double floor = 3.0) {
  Scenario s;
  s.label = "fixture";
  s.safety_floor = floor;
  s.cargo_requirement_dwt = 100.0;
  s.required_fuel_types = fuel_set_of({FuelType::Distillate, FuelType::Lng});
  return s;
}

void test_fleet() {
  const VesselTable t(ten_vessel_rows());

  const Fleet f = Fleet::from_ids(t, {7, 2, 9});
  expect_ids(f.ids(), {2, 7, 9}, "Fleet: ids sorted");
  expect_true(f.contains(7) && !f.contains(3), "Fleet: contains");
  expect_true(Fleet::from_indices(t, {6, 1, 8}) == f, "Fleet: from_indices matches from_ids");

  bool threw = false;
  try {
    (void)Fleet::from_ids(t, {1, 1});
  } catch (const MalformedInputError&) {
    threw = true;
  }
  expect_true(threw, "Fleet: duplicate id rejected");

  threw = false;
  try {
    (void)Fleet::from_ids(t, {1, 42});
  } catch (const MalformedInputError&) {
    threw = true;
  }
  expect_true(threw, "Fleet: unknown id rejected");
}

void test_feasibility() {
  const VesselTable t(ten_vessel_rows());
  const Scenario sc = two_fuel_scenario();

  const FeasibilityReport empty = evaluate_feasibility(t, sc, Fleet{});
  expect_true(!empty.feasible(), "Feasibility: empty fleet infeasible");
  expect_true(empty.metrics.avg_safety == 0.0 && empty.metrics.total_dwt == 0.0, "Feasibility: empty metrics zero");
  expect_true(empty.missing_fuels == sc.required_fuel_types, "Feasibility: empty fleet misses every fuel");

  // Only distillate vessels: DWT and safety pass, coverage fails.
  const FeasibilityReport a_only = evaluate_feasibility(t, sc, Fleet::from_ids(t, {1, 2, 3, 4, 5}));
  expect_true(a_only.checks.size() == 3, "Feasibility: three checks");
  expect_true(a_only.checks[0].constraint_id == "CAPACITY.MIN_DWT" && a_only.checks[0].pass,
              "Feasibility: capacity passes at exactly 100 t");
  expect_true(a_only.checks[1].constraint_id == "SAFETY.MIN_AVG" && a_only.checks[1].pass,
              "Feasibility: safety passes at 3.4");
  expect_true(a_only.checks[2].constraint_id == "FUEL.COVERAGE" && !a_only.checks[2].pass,
              "Feasibility: coverage fails without LNG");
  expect_true(a_only.missing_fuels == fuel_set_of({FuelType::Lng}), "Feasibility: missing fuel is LNG");
  expect_true(a_only.summary().find("FUEL.COVERAGE=FAIL") != std::string::npos, "Feasibility: summary names failure");

  const FleetMetrics m = compute_metrics(t, Fleet::from_ids(t, {1, 2, 6, 7, 8, 9}));
  expect_near(m.total_cost, 565.0, 1e-9, "Metrics: total cost");
  expect_near(m.total_dwt, 100.0, 1e-9, "Metrics: total dwt");
  expect_near(m.avg_safety, 19.0 / 6.0, 1e-12, "Metrics: unweighted mean safety");
  expect_near(m.total_co2_eq, 50.0, 1e-9, "Metrics: co2 total");
  expect_true(m.fuel_type_count() == 2, "Metrics: fuel type count");
  expect_true(is_feasible(t, sc, Fleet::from_ids(t, {1, 2, 6, 7, 8, 9})), "Feasibility: optimal fleet feasible");

  // A mean that equals the floor must pass despite rounding in the sum.
  const VesselTable r({make_vessel(1, 50, FuelType::Distillate, 0.1, 1), make_vessel(2, 50, FuelType::Lng, 0.2, 1)});
  expect_true(is_feasible(r, two_fuel_scenario(0.15), Fleet::from_ids(r, {1, 2})),
              "Feasibility: floor met within tolerance");
}

void test_greedy_fixture() {
  const VesselTable t(ten_vessel_rows());
  const GreedyResult g = select_greedy(t, two_fuel_scenario());

  expect_true(g.status == ResultCode::Ok && g.ok(), "Greedy: status Ok");
  expect_true(g.fleet.has_value(), "Greedy: fleet present");
  if (!g.fleet) return;
  expect_ids(g.fleet->ids(), {1, 2, 3, 6, 7, 8}, "Greedy: fleet ids");
  expect_near(g.metrics.total_cost, 585.0, 1e-9, "Greedy: cost");
  expect_near(g.metrics.total_dwt, 105.0, 1e-9, "Greedy: dwt");

  std::vector<VesselId> order;
  for (const auto& e : g.log) order.push_back(e.vessel_id);
  expect_ids(order, {1, 6, 7, 2, 8, 3}, "Greedy: selection order (seeds, then fill with id tie-break)");
  expect_true(g.log.size() == 6 && g.log[0].phase == SelectionPhase::Seed && g.log[1].phase == SelectionPhase::Seed &&
                  g.log[2].phase == SelectionPhase::Fill && g.log[5].rank == 6,
              "Greedy: phases and ranks");

  // Shuffled input rows give the identical result.
  std::vector<Vessel> rows = ten_vessel_rows();
  std::vector<Vessel> shuffled;
  for (std::size_t i = 0; i < rows.size(); ++i) shuffled.push_back(rows[(i * 7 + 3) % rows.size()]);
  const GreedyResult g2 = select_greedy(VesselTable(shuffled), two_fuel_scenario());
  expect_true(g2.fleet.has_value() && *g2.fleet == *g.fleet, "Greedy: independent of input order");
  bool same_log = g2.log.size() == g.log.size();
  for (std::size_t i = 0; same_log && i < g.log.size(); ++i) {
    same_log = g2.log[i].vessel_id == g.log[i].vessel_id && g2.log[i].reason == g.log[i].reason;
  }
  expect_true(same_log, "Greedy: identical audit log on shuffled input");
}

void test_greedy_outcomes() {
  const VesselTable t(ten_vessel_rows());

  // Safety is not enforced while filling: 19/6 < 3.2.
  const GreedyResult miss = select_greedy(t, two_fuel_scenario(3.2));
  expect_true(miss.status == ResultCode::ConstraintUnsatisfied, "Greedy: safety miss is ConstraintUnsatisfied");
  expect_true(miss.fleet.has_value() && miss.fleet->size() == 6, "Greedy: fleet kept on safety miss");
  expect_true(!miss.report.feasible() && !miss.report.checks[1].pass, "Greedy: report shows SAFETY.MIN_AVG fail");

  // No LNG vessel at all.
  std::vector<Vessel> a_rows;
  for (const auto& v : ten_vessel_rows()) {
    if (v.main_fuel_type == FuelType::Distillate) a_rows.push_back(v);
  }
  const GreedyResult no_fuel = select_greedy(VesselTable(a_rows), two_fuel_scenario());
  expect_true(no_fuel.status == ResultCode::InfeasibleScenario && !no_fuel.fleet,
              "Greedy: missing fuel type is InfeasibleScenario without fleet");

  // Pool runs out before the DWT requirement (total 175 t).
  Scenario big = two_fuel_scenario();
  big.cargo_requirement_dwt = 1000.0;
  const GreedyResult exhausted = select_greedy(t, big);
  expect_true(exhausted.status == ResultCode::InfeasibleScenario && !exhausted.fleet,
              "Greedy: exhausted pool is InfeasibleScenario");
  expect_true(exhausted.log.size() == 10, "Greedy: audit log kept when pool exhausted");
}

}  // namespace
}  // namespace fleetopt

int main() {
  using namespace fleetopt;
  set_log_level(LogLevel::ERROR);

  test_fleet();
  test_feasibility();
  test_greedy_fixture();
  test_greedy_outcomes();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
