/*
  Fragment 6.2 — CSV Export Selftest

  Objective
  ---------
    1) Escaping: delimiters, quotes and newlines are quoted; plain text is not.
    2) Non-finite numbers become empty cells, never "nan"/"inf".
    3) Roster follows the selection log when one is given, id order otherwise.
    4) Infeasible analytics rows leave metric cells empty.
    5) Submission sheet has the fixed header and row order.
    6) write_csv_file reports an unwritable path as IOError.

  Integration
  ----------
  Compiles standalone against the fleetopt engine library.
  It does NOT require Catch2/GoogleTest/etc.

  Expected use
  ------------
      ./report_csv_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/exports/report_csv.hpp"
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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
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

void test_escaping() {
  expect_eq_str(csv_escape("plain"), "plain", "Escape: plain text untouched");
  expect_eq_str(csv_escape("a,b"), "\"a,b\"", "Escape: delimiter quoted");
  expect_eq_str(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"", "Escape: quotes doubled");
  expect_eq_str(csv_escape("a;b", ';'), "\"a;b\"", "Escape: custom delimiter quoted");
  expect_eq_str(csv_escape("line\nbreak"), "\"line\nbreak\"", "Escape: newline quoted");

  expect_eq_str(csv_double(1.5, 2), "1.50", "Number: fixed precision");
  expect_eq_str(csv_double(std::numeric_limits<double>::quiet_NaN()), "", "Number: NaN is empty");
  expect_eq_str(csv_double(std::numeric_limits<double>::infinity()), "", "Number: Inf is empty");
}

void test_roster_and_log() {
  const VesselTable t({make_vessel(1, 20, FuelType::Distillate, 3, 100), make_vessel(2, 20, FuelType::Distillate, 4, 120),
                       make_vessel(6, 15, FuelType::LpgPropane, 3, 60), make_vessel(7, 15, FuelType::LpgPropane, 4, 75)});
  Scenario sc;
  sc.cargo_requirement_dwt = 60.0;
  sc.required_fuel_types = fuel_set_of({FuelType::Distillate, FuelType::LpgPropane});
  const GreedyResult g = select_greedy(t, sc);
  expect_true(g.fleet.has_value(), "Roster: greedy fleet present");
  if (!g.fleet) return;

  std::ostringstream with_log;
  write_fleet_roster_csv(with_log, t, *g.fleet, g.log);
  const auto rows = lines_of(with_log.str());
  expect_true(rows.size() == 1 + g.fleet->size(), "Roster: header plus one row per vessel");
  expect_eq_str(rows[0],
                "vessel_id,phase,rank,dwt,main_engine_fuel_type,safety_score,adjusted_cost,cost_per_dwt,"
                "co2eq_total,fuel_total",
                "Roster: header");
  expect_true(rows.size() > 1 && rows[1].rfind("1,seed,1,", 0) == 0, "Roster: first row is the first seed");
  expect_true(rows.size() > 2 && rows[2].find("\"LPG (Propane)\"") == std::string::npos &&
                  rows[2].find("LPG (Propane)") != std::string::npos,
              "Roster: fuel name needs no quoting");

  std::ostringstream no_log;
  CsvExportOptions opt;
  opt.include_header = false;
  write_fleet_roster_csv(no_log, t, Fleet::from_ids(t, {7, 1}), {}, opt);
  const auto plain = lines_of(no_log.str());
  expect_true(plain.size() == 2 && plain[0].rfind("1,solver,1,", 0) == 0 && plain[1].rfind("7,solver,2,", 0) == 0,
              "Roster: solver fleet in id order");

  std::ostringstream log_csv;
  write_selection_log_csv(log_csv, g.log);
  const auto log_rows = lines_of(log_csv.str());
  expect_eq_str(log_rows[0], "rank,vessel_id,phase,reason", "Log: header");
  expect_true(log_rows.size() == 1 + g.log.size(), "Log: one row per entry");
  expect_true(log_rows.size() > 1 &&
                  log_rows[1] == "1,1,seed,representative for Distillate fuel; cost_per_dwt=5.00 safety=3.00 dwt=20",
              "Log: first seed row");

  std::ostringstream feas;
  write_feasibility_csv(feas, g.report);
  const auto f = lines_of(feas.str());
  expect_true(f.size() == 4 && f[1].rfind("CAPACITY.MIN_DWT,true,", 0) == 0, "Feasibility: capacity row");
}

void test_analytics_and_submission() {
  analysis::AnalyticsRow bad;
  bad.query = "pareto/unconstrained";
  bad.label = "pareto_unconstrained_s4.00";
  bad.parameter = 4.0;
  bad.status = SolveStatus::Infeasible;
  bad.total_cost = std::numeric_limits<double>::quiet_NaN();

  std::ostringstream os;
  write_analytics_csv(os, {bad});
  const auto rows = lines_of(os.str());
  expect_true(rows.size() == 2, "Analytics: header plus row");
  expect_true(rows.size() == 2 && rows[1].find("Infeasible,false,,,,,,,,") != std::string::npos,
              "Analytics: infeasible metrics empty");
  expect_true(os.str().find("nan") == std::string::npos, "Analytics: no nan literal");

  FleetMetrics m;
  m.size = 3;
  m.total_dwt = 1234.5;
  m.total_cost = 999.999;
  m.avg_safety = 3.456;
  m.fuel_coverage = fuel_set_of({FuelType::Lng, FuelType::Ammonia});
  SubmissionInfo info;
  info.team_name = "Blue, Team";

  std::ostringstream sub;
  write_submission_csv(sub, m, info);
  const auto s = lines_of(sub.str());
  expect_true(s.size() == 12, "Submission: header plus eleven rows");
  if (s.size() == 12) {
    expect_eq_str(s[0], "Header Name,Data Type,Units,Submission", "Submission: header");
    expect_eq_str(s[1], "team_name,String,-,\"Blue, Team\"", "Submission: team name escaped");
    expect_eq_str(s[4], "sum_of_fleet_deadweight,Float,tonnes,1234.50", "Submission: deadweight");
    expect_eq_str(s[5], "total_cost_of_fleet,Float,dollars,1000.00", "Submission: cost rounded");
    expect_eq_str(s[6], "average_fleet_safety_score,Float,-,3.46", "Submission: safety rounded");
    expect_eq_str(s[7], "no_of_unique_main_engine_fuel_types_in_fleet,Integer,-,2", "Submission: fuel types");
    expect_eq_str(s[8], "sensitivity_analysis_performance,String,Yes/No,Yes", "Submission: sensitivity flag");
    expect_eq_str(s[9], "size_of_fleet_count,Integer,-,3", "Submission: fleet size");
  }

  bool threw = false;
  try {
    write_csv_file("/nonexistent-dir/fleetopt/out.csv", [](std::ostream& o) { o << "x\n"; });
  } catch (const IOError&) {
    threw = true;
  }
  expect_true(threw, "File: unwritable path is IOError");
}

}  // namespace
}  // namespace fleetopt

int main() {
  using namespace fleetopt;
  set_log_level(LogLevel::ERROR);

  test_escaping();
  test_roster_and_log();
  test_analytics_and_submission();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
