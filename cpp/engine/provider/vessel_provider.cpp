#include "engine/provider/vessel_provider.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace fleetopt {

namespace {

constexpr const char* kComponent = "provider";

// Splits one CSV line. Quoted fields may contain the delimiter and "" escapes.
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  out.push_back(std::move(cur));
  return out;
}

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
  return s.substr(b, e - b);
}

class RowReader {
 public:
  RowReader(const std::string& path, std::size_t line_no, const std::vector<std::string>& fields,
            const std::map<std::string, std::size_t>& columns)
      : path_(path), line_no_(line_no), fields_(fields), columns_(columns) {}

  bool has(const std::string& col) const {
    auto it = columns_.find(col);
    return it != columns_.end() && it->second < fields_.size() && !trim(fields_[it->second]).empty();
  }

  std::string text(const std::string& col) const {
    auto it = columns_.find(col);
    if (it == columns_.end() || it->second >= fields_.size()) fail("missing field '" + col + "'");
    return trim(fields_[it->second]);
  }

  double number(const std::string& col) const {
    const std::string s = text(col);
    if (s.empty()) fail("empty field '" + col + "'");
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
      fail("field '" + col + "' is not a finite number: '" + s + "'");
    }
    return v;
  }

  VesselId id(const std::string& col) const {
    const std::string s = text(col);
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || s.empty() || *end != '\0') fail("field '" + col + "' is not an integer id: '" + s + "'");
    return static_cast<VesselId>(v);
  }

  [[noreturn]] void fail(const std::string& what) const {
    throw MalformedInputError(path_ + ":" + std::to_string(line_no_) + ": " + what);
  }

 private:
  const std::string& path_;
  std::size_t line_no_;
  const std::vector<std::string>& fields_;
  const std::map<std::string, std::size_t>& columns_;
};

const char* const kRequiredColumns[] = {
    "vessel_id", "dwt", "main_engine_fuel_type", "safety_score",
    "adjusted_cost", "co2eq_total", "fuel_total"};

}  // namespace

// ----------------------------- Providers -------------------------------------

VesselTable StaticVesselProvider::vessels_for(const Scenario& scenario) const {
  log(LogLevel::DEBUG, kComponent,
      "[" + scenario.label + "] static table, " + std::to_string(table_.size()) + " vessels");
  return table_;
}

double risk_rate(double safety_score) {
  const double r = std::round(safety_score);
  if (std::fabs(safety_score - r) > 1e-9) {
    throw MalformedInputError("risk_rate: safety score " + std::to_string(safety_score) + " is not an integer grade");
  }
  switch (static_cast<int>(r)) {
    case 1: return 0.10;
    case 2: return 0.05;
    case 3: return 0.00;
    case 4: return -0.02;
    case 5: return -0.05;
    default:
      throw MalformedInputError("risk_rate: safety score " + std::to_string(safety_score) + " outside 1..5");
  }
}

double reprice(const VesselRecord& record, double carbon_price_usd_per_t) {
  if (!record.costs) return record.vessel.adjusted_cost;
  const CostDecomposition& c = *record.costs;
  const double total = c.fuel_cost + record.vessel.co2_eq * carbon_price_usd_per_t + c.monthly_ownership_cost;
  return total * (1.0 + risk_rate(record.vessel.safety_score));
}

CostTableProvider::CostTableProvider(std::vector<VesselRecord> records) : records_(std::move(records)) {
  std::vector<Vessel> check;
  check.reserve(records_.size());
  for (const auto& r : records_) {
    if (r.costs) {
      FLEETOPT_REQUIRE(std::isfinite(r.costs->fuel_cost) && r.costs->fuel_cost >= 0.0, MalformedInputError,
                       "CostTableProvider: vessel " + std::to_string(r.vessel.id) + " fuel_cost must be >= 0");
      FLEETOPT_REQUIRE(std::isfinite(r.costs->monthly_ownership_cost) && r.costs->monthly_ownership_cost >= 0.0,
                       MalformedInputError,
                       "CostTableProvider: vessel " + std::to_string(r.vessel.id) +
                           " monthly_ownership_cost must be >= 0");
      (void)risk_rate(r.vessel.safety_score);
    }
    check.push_back(r.vessel);
  }
  // Duplicate ids and field ranges fail here rather than on first use.
  VesselTable validated(std::move(check));
  (void)validated;
}

VesselTable CostTableProvider::vessels_for(const Scenario& scenario) const {
  std::vector<Vessel> rows;
  rows.reserve(records_.size());
  std::size_t repriced = 0;
  for (const auto& r : records_) {
    Vessel v = r.vessel;
    if (r.costs) {
      v.adjusted_cost = reprice(r, scenario.carbon_price_usd_per_t);
      ++repriced;
    }
    rows.push_back(v);
  }
  log(LogLevel::INFO, kComponent,
      "[" + scenario.label + "] carbon price " + std::to_string(scenario.carbon_price_usd_per_t) +
          " USD/t: repriced " + std::to_string(repriced) + " of " + std::to_string(records_.size()) + " vessels");
  return VesselTable(std::move(rows));
}

// ----------------------------- CSV -------------------------------------------

std::vector<VesselRecord> load_vessel_records_csv(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw IOError("load_vessel_records_csv: cannot open '" + path + "'");
  }

  std::string line;
  std::size_t line_no = 0;
  std::map<std::string, std::size_t> columns;

  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    const auto header = split_csv_line(line);
    for (std::size_t i = 0; i < header.size(); ++i) columns[trim(header[i])] = i;
    break;
  }
  if (columns.empty()) {
    throw MalformedInputError(path + ": missing header row");
  }
  for (const char* col : kRequiredColumns) {
    if (columns.find(col) == columns.end()) {
      throw MalformedInputError(path + ": header lacks required column '" + std::string(col) + "'");
    }
  }

  std::vector<VesselRecord> out;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    const auto fields = split_csv_line(line);
    RowReader row(path, line_no, fields, columns);

    VesselRecord rec;
    rec.vessel.id = row.id("vessel_id");
    rec.vessel.dwt = row.number("dwt");

    const std::string fuel = row.text("main_engine_fuel_type");
    const auto ft = parse_fuel_type(fuel);
    if (!ft) row.fail("unknown main_engine_fuel_type '" + fuel + "'");
    rec.vessel.main_fuel_type = *ft;

    rec.vessel.safety_score = row.number("safety_score");
    rec.vessel.adjusted_cost = row.number("adjusted_cost");
    rec.vessel.co2_eq = row.number("co2eq_total");
    rec.vessel.fuel_total = row.number("fuel_total");

    const bool has_fuel_cost = row.has("fuel_cost");
    const bool has_ownership = row.has("monthly_ownership_cost");
    if (has_fuel_cost != has_ownership) {
      row.fail("fuel_cost and monthly_ownership_cost must be given together");
    }
    if (has_fuel_cost) {
      rec.costs = CostDecomposition{row.number("fuel_cost"), row.number("monthly_ownership_cost")};
    }

    try {
      rec.vessel.validate_or_throw();
    } catch (const MalformedInputError& e) {
      row.fail(e.what());
    }
    out.push_back(std::move(rec));
  }

  if (in.bad()) {
    throw IOError("load_vessel_records_csv: read error on '" + path + "'");
  }

  log(LogLevel::INFO, kComponent, "loaded " + std::to_string(out.size()) + " vessel records from " + path);
  return out;
}

}  // namespace fleetopt
