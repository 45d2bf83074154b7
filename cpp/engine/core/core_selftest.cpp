/*
  Fragment 1.10 — Core Selftest (Fuel Catalogue, Vessel Table, Scenario, Hashing)

  Objective
  ---------
  Framework-free checks for the core value types every later stage relies on:
    1) Fuel-type names parse case-insensitively and with surrounding blanks.
    2) VesselTable sorts by id, rejects duplicate ids and invalid rows.
    3) Scenario / settings validation rejects nonsense before any search.
    4) Hashing is stable: -0.0 == 0.0, every NaN hashes alike, fingerprints
       ignore input row order.
    5) Log-level parsing accepts the documented names only.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./core_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/fuel_type.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_fingerprint.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/vessel.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class Fn>
void expect_malformed(Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected MalformedInputError, nothing thrown\n";
  } catch (const MalformedInputError&) {
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

void test_fuel_catalogue() {
  expect_true(parse_fuel_type("LNG") == FuelType::Lng, "Fuel: exact name parses");
  expect_true(parse_fuel_type("  lng ") == FuelType::Lng, "Fuel: trimmed lower-case name parses");
  expect_true(parse_fuel_type("lpg (butane)") == FuelType::LpgButane, "Fuel: name with punctuation parses");
  expect_true(parse_fuel_type("Distillate fuel") == FuelType::Distillate, "Fuel: two-word name parses");
  expect_true(!parse_fuel_type("Diesel").has_value(), "Fuel: unknown name rejected");
  expect_true(!parse_fuel_type("").has_value(), "Fuel: empty name rejected");

  expect_true(all_fuel_types().count() == kFuelTypeCount, "Fuel: all_fuel_types covers catalogue");
  expect_eq_str(fuel_set_to_string(fuel_set_of({FuelType::Methanol, FuelType::Lng})), "LNG; Methanol",
                "Fuel: set renders in enum order");
  expect_eq_str(fuel_set_to_string(FuelSet{}), "", "Fuel: empty set renders empty");
}

void test_vessel_table() {
  VesselTable t({make_vessel(30, 10, FuelType::Lng, 3, 50),
                 make_vessel(10, 20, FuelType::Distillate, 4, 80),
                 make_vessel(20, 15, FuelType::Lng, 2, 30)});

  expect_true(t.size() == 3, "Table: size");
  expect_true(t.at(0).id == 10 && t.at(1).id == 20 && t.at(2).id == 30, "Table: rows sorted by id");
  expect_true(t.index_of(20) == std::optional<std::size_t>(1), "Table: index_of finds id");
  expect_true(!t.index_of(99).has_value(), "Table: index_of misses unknown id");
  expect_true(t.find(30) != nullptr && t.find(30)->dwt == 10.0, "Table: find returns row");
  expect_true(t.indices_of_fuel(FuelType::Lng) == std::vector<std::size_t>{1, 2}, "Table: indices_of_fuel");
  expect_true(t.fuel_types_present() == fuel_set_of({FuelType::Distillate, FuelType::Lng}),
              "Table: fuel_types_present");
  expect_true(t.total_dwt() == 45.0, "Table: total_dwt");

  expect_malformed([] { VesselTable bad({make_vessel(1, 10, FuelType::Lng, 3, 5),
                                         make_vessel(1, 12, FuelType::Lng, 3, 5)}); },
                   "Table: duplicate id rejected");
  expect_malformed([] { VesselTable bad({make_vessel(1, 0, FuelType::Lng, 3, 5)}); },
                   "Table: zero dwt rejected");
  expect_malformed([] { VesselTable bad({make_vessel(1, 10, FuelType::Lng, 3, -1)}); },
                   "Table: negative cost rejected");
  expect_malformed([] {
    VesselTable bad({make_vessel(1, 10, FuelType::Lng, std::numeric_limits<double>::quiet_NaN(), 5)});
  }, "Table: NaN safety rejected");
}

void test_scenario_and_settings() {
  const Scenario base = Scenario::defaults();
  expect_true(base.safety_floor == 3.0, "Scenario: default floor");
  expect_true(base.cargo_requirement_dwt == 54.92e6 / 12.0, "Scenario: default cargo requirement");
  expect_true(base.required_fuel_types == all_fuel_types(), "Scenario: default requires every fuel");
  expect_true(base.carbon_price_usd_per_t == 80.0, "Scenario: default carbon price");

  const Scenario s4 = base.with_safety_floor(4.0).with_label("s4");
  expect_true(s4.safety_floor == 4.0 && base.safety_floor == 3.0, "Scenario: with_* leaves original intact");
  expect_eq_str(s4.label, "s4", "Scenario: with_label");

  Scenario bad = base;
  bad.cargo_requirement_dwt = 0.0;
  expect_malformed([&] { bad.validate_or_throw(); }, "Scenario: zero cargo requirement rejected");
  expect_malformed([&] { base.with_carbon_price(-1.0).validate_or_throw(); },
                   "Scenario: negative carbon price rejected");

  RunSettings rs = RunSettings::defaults();
  rs.workers = 0;
  expect_malformed([&] { rs.validate_or_throw(); }, "Settings: zero workers rejected");
  SolverSettings ss;
  ss.integrality_tol = 0.5;
  expect_malformed([&] { ss.validate_or_throw(); }, "Settings: loose integrality_tol rejected");
}

void test_hashing() {
  expect_eq_str(hash_to_hex(Fnv1a64{}.digest()), "cbf29ce484222325", "Hash: empty digest is FNV offset basis");

  Fnv1a64 a, b;
  a.update_f64(0.0);
  b.update_f64(-0.0);
  expect_true(a.digest() == b.digest(), "Hash: -0.0 folds to 0.0");

  Fnv1a64 n1, n2;
  n1.update_f64(std::numeric_limits<double>::quiet_NaN());
  n2.update_f64(-std::numeric_limits<double>::quiet_NaN());
  expect_true(n1.digest() == n2.digest(), "Hash: NaN payloads canonicalized");

  Fnv1a64 t1, t2;
  t1.update_tag("ab");
  t1.update_tag("c");
  t2.update_tag("a");
  t2.update_tag("bc");
  expect_true(t1.digest() != t2.digest(), "Hash: tags are delimited");

  const Vessel v1 = make_vessel(1, 10, FuelType::Lng, 3, 5);
  const Vessel v2 = make_vessel(2, 12, FuelType::Methanol, 4, 7);
  const Scenario sc = Scenario::defaults();
  expect_eq_str(run_input_fingerprint_hex(VesselTable({v1, v2}), sc),
                run_input_fingerprint_hex(VesselTable({v2, v1}), sc),
                "Fingerprint: independent of input row order");
  expect_true(run_input_fingerprint_hex(VesselTable({v1, v2}), sc) !=
                  run_input_fingerprint_hex(VesselTable({v1, v2}), sc.with_safety_floor(3.5)),
              "Fingerprint: changes with scenario");
  expect_true(hash_fleet_ids({3, 1, 2}) == hash_fleet_ids({1, 2, 3}), "Fingerprint: fleet hash is order-free");
}

void test_log_levels() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("DEBUG", &lvl) && lvl == LogLevel::DEBUG, "Log: DEBUG parses");
  expect_true(parse_log_level("warn", &lvl) && lvl == LogLevel::WARN, "Log: warn parses");
  expect_true(!parse_log_level("verbose", &lvl) && lvl == LogLevel::WARN, "Log: unknown level leaves value");

  const LogLevel prev = get_log_level();
  set_log_level(LogLevel::ERROR);
  expect_true(get_log_level() == LogLevel::ERROR, "Log: set/get level");
  set_log_level(prev);
}

}  // namespace
}  // namespace fleetopt

int main() {
  using namespace fleetopt;

  test_fuel_catalogue();
  test_vessel_table();
  test_scenario_and_settings();
  test_hashing();
  test_log_levels();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
