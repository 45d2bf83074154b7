/*
  Fragment 3.4 — Fleet Program Selftest (Exact Optimizer)

  Objective
  ---------
  Framework-free checks for solve_fleet_program():
    1) Ten-vessel fixture: unique optimum, fixed-size variants, infeasible
       sizes, safety floors above the best achievable mean.
    2) Exhaustive enumeration on seeded twelve-vessel tables agrees with the
       branch-and-bound optimum (cost), with and without a fixed size.
    3) The greedy fleet is never cheaper than the exact optimum.
    4) Feasibility-only programs with a cost ceiling.
    5) A node limit never yields a result labelled Optimal.
    6) Repeated solves return the identical fleet.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./fleet_program_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/vessel.hpp"
#include "engine/optimization/fleet_program.hpp"
#include "engine/selection/feasibility.hpp"
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

void expect_near(double got, double exp, std::string_view msg) {
  if (!(std::fabs(got - exp) <= 1e-6)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

void expect_status(SolveStatus got, SolveStatus exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  got " << to_string(got) << ", expected " << to_string(exp) << "\n";
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

Scenario two_fuel_scenario(double floor) {
  Scenario s;
  s.label = "fixture";
  s.safety_floor = floor;
  s.cargo_requirement_dwt = 100.0;
  s.required_fuel_types = fuel_set_of({FuelType::Distillate, FuelType::Lng});
  return s;
}

FleetProgram fixed_size(int n) {
  FleetProgram p = FleetProgram::minimize_cost("fs" + std::to_string(n));
  p.fixed_fleet_size = n;
  return p;
}

// 64-bit LCG (Knuth MMIX constants); deterministic across platforms.
class Lcg {
 public:
  explicit Lcg(std::uint64_t seed) : s_(seed) {}
  int next(int k) {
    s_ = s_ * 6364136223846793005ull + 1442695040888963407ull;
    return static_cast<int>((s_ >> 33) % static_cast<std::uint64_t>(k));
  }

 private:
  std::uint64_t s_;
};

VesselTable random_table(std::uint64_t seed) {
  static const FuelType kFuels[3] = {FuelType::Distillate, FuelType::Lng, FuelType::Methanol};
  Lcg g(seed);
  std::vector<Vessel> rows;
  for (int i = 0; i < 12; ++i) {
    const double dwt = 5 + g.next(26);
    const FuelType f = kFuels[g.next(3)];
    const double s = 1 + g.next(5);
    const double c = 10 + g.next(191);
    rows.push_back(make_vessel(i + 1, dwt, f, s, c));
  }
  return VesselTable(rows);
}

// Cheapest feasible subset by enumeration; nullopt when none exists.
std::optional<double> brute_force_cost(const VesselTable& t, const Scenario& sc, std::optional<int> size) {
  std::optional<double> best;
  const std::size_t n = t.size();
  for (std::uint32_t mask = 1; mask < (1u << n); ++mask) {
    std::vector<std::size_t> chosen;
    for (std::size_t j = 0; j < n; ++j) {
      if (mask & (1u << j)) chosen.push_back(j);
    }
    if (size && chosen.size() != static_cast<std::size_t>(*size)) continue;
    const FleetMetrics m = compute_metrics(t, chosen);
    if (!evaluate_feasibility(t, sc, m).feasible()) continue;
    if (!best || m.total_cost < *best) best = m.total_cost;
  }
  return best;
}

void test_fixture_optimum() {
  const VesselTable t = ten_vessel_table();
  const SolveResult r = solve_fleet_program(t, two_fuel_scenario(3.0), FleetProgram::minimize_cost("opt"));

  expect_status(r.status, SolveStatus::Optimal, "Fixture: optimal");
  expect_true(r.has_fleet() && r.fleet->ids() == std::vector<VesselId>({1, 2, 6, 7, 8, 9}),
              "Fixture: optimal fleet ids");
  expect_near(r.objective_value, 565.0, "Fixture: optimal cost");
  expect_near(r.metrics.total_dwt, 100.0, "Fixture: optimal dwt");
  expect_true(r.certificate.search_exhausted && r.certificate.gap == 0.0, "Fixture: certificate exhausted");
  expect_true(r.certificate.root_lower_bound <= 565.0 + 1e-6, "Fixture: root bound below optimum");
  expect_true(r.code() == ResultCode::Ok, "Fixture: result code Ok");

  const GreedyResult g = select_greedy(t, two_fuel_scenario(3.0));
  expect_true(g.ok() && g.metrics.total_cost >= r.objective_value, "Fixture: greedy never beats exact");

  const double floors[] = {3.2, 3.4, 3.6, 3.8};
  const double costs[] = {615.0, 645.0, 675.0, 735.0};
  for (int i = 0; i < 4; ++i) {
    const SolveResult rf = solve_fleet_program(t, two_fuel_scenario(floors[i]), FleetProgram::minimize_cost("floor"));
    expect_status(rf.status, SolveStatus::Optimal, "Fixture: raised floor still optimal");
    expect_near(rf.objective_value, costs[i], "Fixture: cost at raised floor");
    expect_true(rf.metrics.avg_safety >= floors[i] - kSafetyTolerance, "Fixture: mean safety meets floor");
  }

  const SolveResult hi = solve_fleet_program(t, two_fuel_scenario(4.0), FleetProgram::minimize_cost("s4"));
  expect_status(hi.status, SolveStatus::Infeasible, "Fixture: floor 4.0 infeasible");
  expect_true(!hi.has_fleet() && hi.code() == ResultCode::InfeasibleScenario, "Fixture: no fleet when infeasible");
}

void test_fixture_sizes() {
  const VesselTable t = ten_vessel_table();
  const Scenario sc = two_fuel_scenario(3.0);

  expect_status(solve_fleet_program(t, sc, fixed_size(4)).status, SolveStatus::Infeasible, "Size: N=4 infeasible");
  expect_status(solve_fleet_program(t, sc, fixed_size(5)).status, SolveStatus::Infeasible, "Size: N=5 infeasible");

  const int sizes[] = {6, 7, 8, 9, 10};
  const double costs[] = {565.0, 705.0, 885.0, 1085.0, 1385.0};
  for (int i = 0; i < 5; ++i) {
    const SolveResult r = solve_fleet_program(t, sc, fixed_size(sizes[i]));
    expect_status(r.status, SolveStatus::Optimal, "Size: fixed size optimal");
    expect_near(r.objective_value, costs[i], "Size: fixed size cost");
    expect_true(r.metrics.size == static_cast<std::size_t>(sizes[i]), "Size: fleet has requested size");
  }

  FleetProgram capped = FleetProgram::minimize_cost("max5");
  capped.max_fleet_size = 5;
  expect_status(solve_fleet_program(t, sc, capped).status, SolveStatus::Infeasible, "Size: at most 5 infeasible");
}

void test_against_enumeration() {
  for (std::uint64_t seed = 1; seed <= 8; ++seed) {
    const VesselTable t = random_table(seed);
    for (double safety_floor : {2.5, 3.0, 3.5}) {
      Scenario sc;
      sc.label = "rand";
      sc.safety_floor = safety_floor;
      sc.cargo_requirement_dwt = 80.0;
      sc.required_fuel_types = t.fuel_types_present();

      for (std::optional<int> size : {std::optional<int>(), std::optional<int>(4), std::optional<int>(6)}) {
        FleetProgram p = FleetProgram::minimize_cost("rand");
        p.fixed_fleet_size = size;
        const SolveResult r = solve_fleet_program(t, sc, p);
        const std::optional<double> expect = brute_force_cost(t, sc, size);

        const std::string tag = "Enumeration: seed " + std::to_string(seed) + " floor " + std::to_string(safety_floor) +
                                " size " + (size ? std::to_string(*size) : std::string("any"));
        if (expect) {
          expect_status(r.status, SolveStatus::Optimal, tag + " optimal");
          expect_near(r.objective_value, *expect, tag + " cost");
          expect_true(r.has_fleet() && evaluate_feasibility(t, sc, *r.fleet).feasible(), tag + " fleet feasible");
        } else {
          expect_status(r.status, SolveStatus::Infeasible, tag + " infeasible");
        }
      }
    }
  }
}

void test_feasibility_only() {
  const VesselTable t = ten_vessel_table();
  const Scenario sc = two_fuel_scenario(3.0);

  FleetProgram claim;
  claim.objective = ObjectiveKind::FeasibilityOnly;
  claim.fixed_fleet_size = 6;
  claim.cost_ceiling = 600.0;
  claim.label = "claim";
  const SolveResult ok = solve_fleet_program(t, sc, claim);
  expect_status(ok.status, SolveStatus::Feasible, "FeasibilityOnly: ceiling 600 feasible");
  expect_true(ok.has_fleet() && ok.metrics.total_cost <= 600.0 && ok.metrics.size == 6,
              "FeasibilityOnly: witness respects ceiling and size");
  expect_true(ok.code() == ResultCode::Ok, "FeasibilityOnly: code Ok");

  claim.cost_ceiling = 560.0;
  expect_status(solve_fleet_program(t, sc, claim).status, SolveStatus::Infeasible,
                "FeasibilityOnly: ceiling below optimum infeasible");

  // A ceiling equal to the optimum is not lost to rounding.
  FleetProgram exact = FleetProgram::minimize_cost("ceiling");
  exact.cost_ceiling = 565.0;
  const SolveResult at = solve_fleet_program(t, sc, exact);
  expect_status(at.status, SolveStatus::Optimal, "Ceiling: equal to optimum stays feasible");
}

void test_node_limit() {
  const VesselTable t = ten_vessel_table();
  SolverSettings s;
  s.node_limit = 1;
  const SolveResult r = solve_fleet_program(t, two_fuel_scenario(3.0), FleetProgram::minimize_cost("nl"), s);
  expect_status(r.status, SolveStatus::NodeLimit, "NodeLimit: stops after the root");
  expect_true(!r.certificate.search_exhausted, "NodeLimit: search not exhausted");
  expect_true(r.code() == ResultCode::NodeLimit, "NodeLimit: result code");

  // Two vessels of 20 t against 25 t: the root relaxation is fractional.
  const VesselTable pair({make_vessel(1, 20, FuelType::Lng, 3, 20), make_vessel(2, 20, FuelType::Lng, 3, 20)});
  Scenario sc;
  sc.cargo_requirement_dwt = 25.0;
  sc.required_fuel_types = fuel_set_of({FuelType::Lng});
  expect_status(solve_fleet_program(pair, sc, FleetProgram::minimize_cost("pair"), s).status, SolveStatus::NodeLimit,
                "NodeLimit: fractional root is never labelled optimal");
  const SolveResult full = solve_fleet_program(pair, sc, FleetProgram::minimize_cost("pair"));
  expect_status(full.status, SolveStatus::Optimal, "NodeLimit: unlimited search proves optimum");
  expect_near(full.objective_value, 40.0, "NodeLimit: unlimited optimum cost");
  expect_near(full.certificate.root_lower_bound, 25.0, "NodeLimit: root relaxation takes 1.25 vessels");
  expect_true(full.certificate.nodes_explored >= 3, "NodeLimit: root was branched");
}

void test_missing_fuel_and_determinism() {
  const VesselTable full = ten_vessel_table();
  std::vector<Vessel> a_only;
  for (const auto& v : full.vessels()) {
    if (v.main_fuel_type == FuelType::Distillate) a_only.push_back(v);
  }
  const SolveResult r = solve_fleet_program(VesselTable(a_only), two_fuel_scenario(3.0),
                                            FleetProgram::minimize_cost("no_lng"));
  expect_true(a_only.size() == 5, "Missing fuel: five Distillate vessels remain");
  expect_status(r.status, SolveStatus::Infeasible, "Missing fuel: infeasible before search");
  expect_true(r.certificate.nodes_explored == 0, "Missing fuel: no nodes explored");

  const VesselTable t = random_table(5);
  Scenario sc;
  sc.cargo_requirement_dwt = 80.0;
  sc.required_fuel_types = t.fuel_types_present();
  const SolveResult a = solve_fleet_program(t, sc, FleetProgram::minimize_cost("det"));
  const SolveResult b = solve_fleet_program(t, sc, FleetProgram::minimize_cost("det"));
  expect_true(a.fleet == b.fleet && a.certificate.nodes_explored == b.certificate.nodes_explored,
              "Determinism: identical fleet and node count");
}

}  // namespace
}  // namespace fleetopt

int main() {
  using namespace fleetopt;
  set_log_level(LogLevel::ERROR);

  test_fixture_optimum();
  test_fixture_sizes();
  test_against_enumeration();
  test_feasibility_only();
  test_node_limit();
  test_missing_fuel_and_determinism();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
