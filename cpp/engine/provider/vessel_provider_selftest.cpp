/*
  Fragment 5.3 — Vessel Provider Selftest (CSV Loader + Carbon Repricing)

  Objective
  ---------
    1) Risk-adjusted repricing follows the 1..5 safety grade table.
    2) CostTableProvider reprices only records with a cost decomposition.
    3) The CSV loader is header-driven, accepts quoted fields and blank
       lines, and reports bad rows as "path:line: ..." MalformedInputError.
    4) An unreadable path is an IOError.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library. Writes scratch
  files under the system temp directory.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./vessel_provider_selftest
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/scenario.hpp"
#include "engine/provider/vessel_provider.hpp"

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
  if (!(std::fabs(got - exp) <= 1e-9 * std::max(1.0, std::fabs(exp)))) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

std::string write_scratch(const std::string& name, const std::string& body) {
  const std::filesystem::path p = std::filesystem::temp_directory_path() / ("fleetopt_selftest_" + name);
  std::ofstream ofs(p, std::ios::out | std::ios::trunc);
  ofs << body;
  return p.string();
}

// Expects MalformedInputError whose message contains `needle`.
void expect_load_error(const std::string& name, const std::string& body, const std::string& needle,
                       std::string_view msg) {
  const std::string path = write_scratch(name, body);
  try {
    (void)load_vessel_records_csv(path);
    fail(msg);
    std::cerr << "  nothing thrown\n";
  } catch (const MalformedInputError& e) {
    const std::string what = e.what();
    if (what.find(needle) == std::string::npos) {
      fail(msg);
      std::cerr << "  message: " << what << "\n";
    } else {
      pass(msg);
    }
  }
  std::filesystem::remove(path);
}

const char* kHeader =
    "vessel_id,dwt,main_engine_fuel_type,safety_score,adjusted_cost,co2eq_total,fuel_total,"
    "fuel_cost,monthly_ownership_cost\n";

void test_risk_and_reprice() {
  expect_near(risk_rate(1), 0.10, "Risk: grade 1");
  expect_near(risk_rate(3), 0.0, "Risk: grade 3");
  expect_near(risk_rate(5), -0.05, "Risk: grade 5");

  bool threw = false;
  try {
    (void)risk_rate(3.5);
  } catch (const MalformedInputError&) {
    threw = true;
  }
  expect_true(threw, "Risk: fractional grade rejected");

  VesselRecord r;
  r.vessel.id = 1;
  r.vessel.dwt = 100;
  r.vessel.safety_score = 4;
  r.vessel.adjusted_cost = 1.0;
  r.vessel.co2_eq = 10;
  r.costs = CostDecomposition{1000.0, 500.0};
  expect_near(reprice(r, 80.0), (1000.0 + 800.0 + 500.0) * 0.98, "Reprice: base carbon price");
  expect_near(reprice(r, 160.0), (1000.0 + 1600.0 + 500.0) * 0.98, "Reprice: doubled carbon price");

  VesselRecord plain = r;
  plain.costs.reset();
  plain.vessel.adjusted_cost = 777.0;
  expect_near(reprice(plain, 160.0), 777.0, "Reprice: no decomposition keeps delivered cost");

  VesselRecord fixed_cost;
  fixed_cost.vessel.id = 2;
  fixed_cost.vessel.dwt = 50;
  fixed_cost.vessel.safety_score = 2;
  fixed_cost.vessel.adjusted_cost = 300.0;

  const CostTableProvider provider({r, fixed_cost});
  const VesselTable t = provider.vessels_for(Scenario::defaults().with_carbon_price(160.0));
  expect_true(t.size() == 2, "Provider: table size");
  expect_near(t.find(1)->adjusted_cost, 3100.0 * 0.98, "Provider: decomposed record repriced");
  expect_near(t.find(2)->adjusted_cost, 300.0, "Provider: plain record unchanged");

  const StaticVesselProvider fixed(t);
  expect_true(fixed.vessels_for(Scenario::defaults()).size() == 2 && fixed.name() == "static",
              "Provider: static table passthrough");
}

void test_csv_loader() {
  const std::string body = std::string(kHeader) +
                           "7,12000,LNG,4,1500,10,3,1000,500\n"
                           "\n"
                           "3,9000,\"lpg (propane)\",3,2000,20,4,,\n";
  const std::string path = write_scratch("ok.csv", body);
  const auto recs = load_vessel_records_csv(path);
  std::filesystem::remove(path);

  expect_true(recs.size() == 2, "CSV: two records, blank line skipped");
  if (recs.size() == 2) {
    expect_true(recs[0].vessel.id == 7 && recs[0].vessel.main_fuel_type == FuelType::Lng, "CSV: first row parsed");
    expect_true(recs[0].costs.has_value() && recs[0].costs->fuel_cost == 1000.0, "CSV: cost decomposition read");
    expect_true(recs[1].vessel.main_fuel_type == FuelType::LpgPropane, "CSV: quoted fuel name parsed");
    expect_true(!recs[1].costs.has_value(), "CSV: empty decomposition is optional");
  }

  // Column order follows the header.
  const std::string reordered =
      "dwt,vessel_id,safety_score,main_engine_fuel_type,adjusted_cost,co2eq_total,fuel_total\n"
      "5000,11,5,Methanol,800,1,1\n";
  const std::string p2 = write_scratch("reordered.csv", reordered);
  const auto r2 = load_vessel_records_csv(p2);
  std::filesystem::remove(p2);
  expect_true(r2.size() == 1 && r2[0].vessel.id == 11 && r2[0].vessel.dwt == 5000.0, "CSV: header-driven columns");

  expect_load_error("nohdr.csv", "", "missing header", "CSV: empty file rejected");
  expect_load_error("nocol.csv", "vessel_id,dwt\n1,2\n", "required column", "CSV: missing column rejected");
  expect_load_error("fuel.csv", std::string(kHeader) + "1,100,Diesel,3,10,1,1,,\n", ":2: unknown main_engine_fuel_type",
                    "CSV: unknown fuel reported with line");
  expect_load_error("num.csv", std::string(kHeader) + "1,100,LNG,3,10,1,1,,\n2,abc,LNG,3,10,1,1,,\n",
                    ":3: field 'dwt'", "CSV: bad number reported with line");
  expect_load_error("half.csv", std::string(kHeader) + "1,100,LNG,3,10,1,1,5,\n", "together",
                    "CSV: partial decomposition rejected");
  expect_load_error("neg.csv", std::string(kHeader) + "1,-5,LNG,3,10,1,1,,\n", "dwt must be",
                    "CSV: invalid vessel rejected");

  bool threw = false;
  try {
    (void)load_vessel_records_csv("/nonexistent-dir/fleetopt/none.csv");
  } catch (const IOError&) {
    threw = true;
  }
  expect_true(threw, "CSV: unreadable path is IOError");
}

}  // namespace
}  // namespace fleetopt

int main() {
  using namespace fleetopt;
  set_log_level(LogLevel::ERROR);

  test_risk_and_reprice();
  test_csv_loader();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
