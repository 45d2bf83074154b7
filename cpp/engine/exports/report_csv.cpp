/*
================================================================================
Fragment 5.1 — Engine: CSV Report Writers Implementation
FILE: cpp/engine/exports/report_csv.cpp
================================================================================
*/

#include "engine/exports/report_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

#include "engine/core/errors.hpp"

namespace fleetopt {

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

namespace {

const char* yes_no(bool b) { return b ? "true" : "false"; }

void roster_row(std::ostream& os, const Vessel& v, const char* phase, int rank, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  os << v.id << d
     << phase << d
     << rank << d
     << csv_double(v.dwt, opt.precision) << d
     << csv_escape(fuel_type_name(v.main_fuel_type), d) << d
     << csv_double(v.safety_score, opt.precision) << d
     << csv_double(v.adjusted_cost, opt.precision) << d
     << csv_double(v.cost_per_dwt(), 6) << d
     << csv_double(v.co2_eq, opt.precision) << d
     << csv_double(v.fuel_total, opt.precision) << "\n";
}

}  // namespace

void write_fleet_roster_csv(std::ostream& os,
                            const VesselTable& table,
                            const Fleet& fleet,
                            const std::vector<SelectionEntry>& log,
                            const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "vessel_id" << d << "phase" << d << "rank" << d << "dwt" << d
       << "main_engine_fuel_type" << d << "safety_score" << d << "adjusted_cost" << d
       << "cost_per_dwt" << d << "co2eq_total" << d << "fuel_total" << "\n";
  }

  auto vessel = [&](VesselId id) -> const Vessel& {
    const Vessel* v = table.find(id);
    if (!v) throw MalformedInputError("write_fleet_roster_csv: vessel id " + std::to_string(id) + " not in table");
    return *v;
  };

  if (!log.empty()) {
    for (const auto& e : log) {
      if (!fleet.contains(e.vessel_id)) continue;
      roster_row(os, vessel(e.vessel_id), to_string(e.phase), e.rank, opt);
    }
    return;
  }

  int rank = 0;
  for (VesselId id : fleet.ids()) {
    roster_row(os, vessel(id), to_string(SelectionPhase::Solver), ++rank, opt);
  }
}

void write_selection_log_csv(std::ostream& os,
                             const std::vector<SelectionEntry>& log,
                             const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) os << "rank" << d << "vessel_id" << d << "phase" << d << "reason" << "\n";
  for (const auto& e : log) {
    os << e.rank << d << e.vessel_id << d << to_string(e.phase) << d << csv_escape(e.reason, d) << "\n";
  }
}

void write_feasibility_csv(std::ostream& os, const FeasibilityReport& report, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "constraint_id" << d << "pass" << d << "value" << d << "threshold" << d << "message" << "\n";
  }
  for (const auto& c : report.checks) {
    os << c.constraint_id << d << yes_no(c.pass) << d
       << csv_double(c.value, 6) << d << csv_double(c.threshold, 6) << d
       << csv_escape(c.message, d) << "\n";
  }
}

void write_analytics_csv(std::ostream& os, const analysis::AnalyticsTable& table, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "query" << d << "label" << d << "parameter" << d << "status" << d << "feasible" << d
       << "total_cost" << d << "avg_safety" << d << "fleet_size" << d << "total_dwt" << d
       << "total_co2_eq" << d << "total_fuel" << d << "fuel_types_present" << d
       << "solve_seconds" << d << "nodes" << "\n";
  }
  for (const auto& r : table) {
    os << csv_escape(r.query, d) << d << csv_escape(r.label, d) << d
       << csv_double(r.parameter, 6) << d << to_string(r.status) << d << yes_no(r.feasible) << d;
    if (r.feasible) {
      os << csv_double(r.total_cost, opt.precision) << d
         << csv_double(r.avg_safety, 6) << d
         << r.fleet_size << d
         << csv_double(r.total_dwt, opt.precision) << d
         << csv_double(r.total_co2_eq, opt.precision) << d
         << csv_double(r.total_fuel, opt.precision) << d
         << r.fuel_types_present << d;
    } else {
      os << d << d << d << d << d << d << d;
    }
    os << csv_double(r.solve_seconds, 3) << d << r.nodes << "\n";
  }
}

void write_claim_csv(std::ostream& os, const analysis::ClaimVerdict& v, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "target_fleet_size" << d << "target_safety" << d << "target_cost" << d
       << "exact_claim_feasible" << d << "claim_status" << d
       << "best_cost_at_target" << d << "best_safety_at_target" << d << "best_fleet_size" << d
       << "gap_to_claim" << d << "gap_pct" << d
       << "min_cost_any_size" << d << "fleet_size_at_min_cost" << d << "safety_at_min_cost" << d
       << "note" << "\n";
  }
  os << v.claim.fleet_size << d << csv_double(v.claim.safety_floor, 3) << d
     << csv_double(v.claim.cost_ceiling, opt.precision) << d
     << yes_no(v.feasible) << d << to_string(v.claim_status) << d;
  if (v.best_cost_at_target) {
    os << csv_double(*v.best_cost_at_target, opt.precision) << d
       << csv_double(v.best_safety_at_target, 6) << d << v.best_fleet_size << d
       << csv_double(v.gap_to_claim, opt.precision) << d << csv_double(v.gap_pct, 3) << d;
  } else {
    os << d << d << d << d << d;
  }
  if (v.min_cost_any_size) {
    os << csv_double(*v.min_cost_any_size, opt.precision) << d << v.fleet_size_at_min_cost << d
       << csv_double(v.safety_at_min_cost, 6) << d;
  } else {
    os << d << d << d;
  }
  os << csv_escape(v.note, d) << "\n";
}

void write_marginal_csv(std::ostream& os, const std::vector<analysis::MarginalRow>& rows, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "axis" << d << "from" << d << "to" << d << "cost_from" << d << "cost_to" << d
       << "delta_cost" << d << "marginal_cost_per_unit" << "\n";
  }
  for (const auto& m : rows) {
    os << m.axis << d << csv_double(m.from, 3) << d << csv_double(m.to, 3) << d
       << csv_double(m.cost_from, opt.precision) << d << csv_double(m.cost_to, opt.precision) << d
       << csv_double(m.delta_cost, opt.precision) << d << csv_double(m.per_unit, opt.precision) << "\n";
  }
}

void write_sensitivity_csv(std::ostream& os,
                           const std::vector<analysis::SensitivityRow>& rows,
                           const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "scenario" << d << "safety_floor" << d << "carbon_price" << d
       << "greedy_status" << d << "greedy_cost" << d << "greedy_safety" << d << "greedy_fleet_size" << d
       << "optimal_status" << d << "optimal_cost" << d << "optimal_safety" << d << "optimal_fleet_size" << d
       << "savings" << d << "savings_pct" << d << "input_fingerprint" << "\n";
  }
  for (const auto& r : rows) {
    os << csv_escape(r.label, d) << d << csv_double(r.safety_floor, 3) << d
       << csv_double(r.carbon_price, opt.precision) << d << to_string(r.greedy_status) << d;
    if (r.greedy_has_fleet) {
      os << csv_double(r.greedy.total_cost, opt.precision) << d << csv_double(r.greedy.avg_safety, 6) << d
         << r.greedy.size << d;
    } else {
      os << d << d << d;
    }
    os << to_string(r.optimal_status) << d;
    if (r.optimal_has_fleet) {
      os << csv_double(r.optimal.total_cost, opt.precision) << d << csv_double(r.optimal.avg_safety, 6) << d
         << r.optimal.size << d;
    } else {
      os << d << d << d;
    }
    if (r.gap) {
      os << csv_double(r.gap->savings, opt.precision) << d << csv_double(r.gap->savings_pct, 3) << d;
    } else {
      os << d << d;
    }
    os << r.input_fingerprint << "\n";
  }
}

void write_submission_csv(std::ostream& os, const FleetMetrics& m, const SubmissionInfo& info) {
  auto line = [&](const char* name, const char* type, const char* units, const std::string& value) {
    os << name << ',' << type << ',' << units << ',' << csv_escape(value) << "\n";
  };

  os << "Header Name,Data Type,Units,Submission\n";
  line("team_name", "String", "-", info.team_name);
  line("category", "String", "-", info.category);
  line("report_file_name", "String", "-", info.report_file_name);
  line("sum_of_fleet_deadweight", "Float", "tonnes", csv_double(m.total_dwt, 2));
  line("total_cost_of_fleet", "Float", "dollars", csv_double(m.total_cost, 2));
  line("average_fleet_safety_score", "Float", "-", csv_double(m.avg_safety, 2));
  line("no_of_unique_main_engine_fuel_types_in_fleet", "Integer", "-", std::to_string(m.fuel_type_count()));
  line("sensitivity_analysis_performance", "String", "Yes/No", info.sensitivity_performed ? "Yes" : "No");
  line("size_of_fleet_count", "Integer", "-", std::to_string(m.size));
  line("total_emission_CO2_eq", "Float", "tonnes", csv_double(m.total_co2_eq, 2));
  line("total_fuel_consumption", "Float", "tonnes", csv_double(m.total_fuel, 2));
}

void write_csv_file(const std::string& path, const std::function<void(std::ostream&)>& writer) {
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs.is_open()) throw IOError("write_csv_file: cannot open '" + path + "'");
  writer(ofs);
  ofs.flush();
  if (!ofs.good()) throw IOError("write_csv_file: write failed for '" + path + "'");
}

}  // namespace fleetopt
