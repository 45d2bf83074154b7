#include "engine/selection/feasibility.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "engine/core/errors.hpp"

namespace fleetopt {

namespace {

void accumulate(FleetMetrics& m, const Vessel& v, double& safety_sum) {
  m.total_dwt += v.dwt;
  m.total_cost += v.adjusted_cost;
  m.total_co2_eq += v.co2_eq;
  m.total_fuel += v.fuel_total;
  m.fuel_coverage.set(fuel_index(v.main_fuel_type));
  safety_sum += v.safety_score;
  ++m.size;
}

std::string fmt(double x, int prec) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(prec) << x;
  return o.str();
}

}  // namespace

FleetMetrics compute_metrics(const VesselTable& table, const Fleet& fleet) {
  FleetMetrics m;
  double safety_sum = 0.0;
  for (VesselId id : fleet.ids()) {
    const Vessel* v = table.find(id);
    if (!v) {
      throw MalformedInputError("compute_metrics: vessel id " + std::to_string(id) + " not in vessel table");
    }
    accumulate(m, *v, safety_sum);
  }
  m.avg_safety = (m.size > 0) ? safety_sum / static_cast<double>(m.size) : 0.0;
  return m;
}

FleetMetrics compute_metrics(const VesselTable& table, const std::vector<std::size_t>& indices) {
  FleetMetrics m;
  double safety_sum = 0.0;
  for (std::size_t idx : indices) accumulate(m, table.at(idx), safety_sum);
  m.avg_safety = (m.size > 0) ? safety_sum / static_cast<double>(m.size) : 0.0;
  return m;
}

FeasibilityReport evaluate_feasibility(const VesselTable& table,
                                       const Scenario& scenario,
                                       const Fleet& fleet) {
  return evaluate_feasibility(table, scenario, compute_metrics(table, fleet));
}

FeasibilityReport evaluate_feasibility(const VesselTable& /*table*/,
                                       const Scenario& scenario,
                                       const FleetMetrics& metrics) {
  FeasibilityReport r;
  r.metrics = metrics;

  {
    ConstraintCheck c;
    c.constraint_id = "CAPACITY.MIN_DWT";
    c.value = metrics.total_dwt;
    c.threshold = scenario.cargo_requirement_dwt;
    c.pass = metrics.total_dwt >= scenario.cargo_requirement_dwt;
    c.message = "total DWT " + fmt(c.value, 0) + (c.pass ? " >= " : " < ") + fmt(c.threshold, 0);
    r.checks.push_back(std::move(c));
  }

  {
    ConstraintCheck c;
    c.constraint_id = "SAFETY.MIN_AVG";
    c.value = metrics.avg_safety;
    c.threshold = scenario.safety_floor;
    c.pass = metrics.size > 0 && metrics.avg_safety >= scenario.safety_floor - kSafetyTolerance;
    c.message = "average safety " + fmt(c.value, 3) + (c.pass ? " >= " : " < ") + fmt(c.threshold, 3);
    r.checks.push_back(std::move(c));
  }

  {
    r.missing_fuels = scenario.required_fuel_types & ~metrics.fuel_coverage;
    ConstraintCheck c;
    c.constraint_id = "FUEL.COVERAGE";
    c.value = static_cast<double>((scenario.required_fuel_types & metrics.fuel_coverage).count());
    c.threshold = static_cast<double>(scenario.required_fuel_types.count());
    c.pass = r.missing_fuels.none();
    c.message = c.pass ? "all required fuel types present"
                       : "missing fuel types: " + fuel_set_to_string(r.missing_fuels);
    r.checks.push_back(std::move(c));
  }

  return r;
}

std::string FeasibilityReport::summary() const {
  std::ostringstream o;
  bool first = true;
  for (const auto& c : checks) {
    if (!first) o << ' ';
    first = false;
    o << c.constraint_id << '=';
    if (c.pass) {
      o << "PASS";
    } else {
      o << "FAIL(" << c.message << ')';
    }
  }
  return o.str();
}

}  // namespace fleetopt
