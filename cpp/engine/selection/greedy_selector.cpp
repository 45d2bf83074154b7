#include "engine/selection/greedy_selector.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <utility>

#include "engine/core/logging.hpp"

namespace fleetopt {

namespace {

constexpr const char* kComponent = "greedy";

// (cost_per_dwt, id) ascending. Table is id-sorted, so index order == id order.
bool cheaper(const VesselTable& t, std::size_t a, std::size_t b) {
  const double ca = t.at(a).cost_per_dwt();
  const double cb = t.at(b).cost_per_dwt();
  if (ca != cb) return ca < cb;
  return t.at(a).id < t.at(b).id;
}

std::string describe(const Vessel& v) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2)
    << "cost_per_dwt=" << v.cost_per_dwt()
    << " safety=" << v.safety_score
    << " dwt=" << std::setprecision(0) << v.dwt;
  return o.str();
}

}  // namespace

GreedyResult select_greedy(const VesselTable& table, const Scenario& scenario) {
  scenario.validate_or_throw();

  GreedyResult out;
  std::vector<std::size_t> chosen;
  std::vector<bool> taken(table.size(), false);
  double dwt = 0.0;

  auto take = [&](std::size_t idx, SelectionPhase phase, std::string reason) {
    const Vessel& v = table.at(idx);
    taken[idx] = true;
    chosen.push_back(idx);
    dwt += v.dwt;

    SelectionEntry e;
    e.vessel_id = v.id;
    e.phase = phase;
    e.rank = static_cast<int>(chosen.size());
    e.reason = std::move(reason);
    log(LogLevel::INFO, kComponent,
        std::string(to_string(phase)) + " #" + std::to_string(e.rank) + ": vessel " +
            std::to_string(v.id) + " (" + e.reason + ")");
    out.log.push_back(std::move(e));
  };

  // ---- Phase 1: seed one representative per required fuel type ----
  log(LogLevel::INFO, kComponent,
      "[" + scenario.label + "] phase 1: seeding " +
          std::to_string(scenario.required_fuel_types.count()) + " fuel types");

  for (FuelType f : kAllFuelTypes) {
    if (!scenario.required_fuel_types.test(fuel_index(f))) continue;

    const auto pool = table.indices_of_fuel(f);
    if (pool.empty()) {
      out.status = ResultCode::InfeasibleScenario;
      out.message = std::string("no vessel available for required fuel type ") + fuel_type_name(f);
      log(LogLevel::WARN, kComponent, "[" + scenario.label + "] " + out.message);
      return out;
    }

    const std::size_t best = *std::min_element(
        pool.begin(), pool.end(), [&](std::size_t a, std::size_t b) { return cheaper(table, a, b); });
    take(best, SelectionPhase::Seed,
         std::string("representative for ") + fuel_type_name(f) + "; " + describe(table.at(best)));
  }

  // ---- Phase 2: fill by ascending cost_per_dwt ----
  log(LogLevel::INFO, kComponent,
      "[" + scenario.label + "] phase 2: filling to " +
          std::to_string(static_cast<long long>(scenario.cargo_requirement_dwt)) + " t DWT");

  std::vector<std::size_t> order;
  order.reserve(table.size());
  for (std::size_t i = 0; i < table.size(); ++i) {
    if (!taken[i]) order.push_back(i);
  }
  std::sort(order.begin(), order.end(),
            [&](std::size_t a, std::size_t b) { return cheaper(table, a, b); });

  for (std::size_t idx : order) {
    if (dwt >= scenario.cargo_requirement_dwt) break;
    take(idx, SelectionPhase::Fill, describe(table.at(idx)));
  }

  if (dwt < scenario.cargo_requirement_dwt) {
    out.status = ResultCode::InfeasibleScenario;
    std::ostringstream m;
    m << std::fixed << std::setprecision(0)
      << "vessel pool exhausted at " << dwt << " t DWT (< " << scenario.cargo_requirement_dwt << ")";
    out.message = m.str();
    log(LogLevel::WARN, kComponent, "[" + scenario.label + "] " + out.message);
    return out;
  }

  // ---- Validate (safety is checked only here) ----
  Fleet fleet = Fleet::from_indices(table, chosen);
  out.report = evaluate_feasibility(table, scenario, fleet);
  out.metrics = out.report.metrics;
  out.fleet = std::move(fleet);

  std::ostringstream summary;
  summary << std::fixed << std::setprecision(2)
          << "[" << scenario.label << "] fleet=" << out.metrics.size
          << " dwt=" << std::setprecision(0) << out.metrics.total_dwt
          << " cost=" << std::setprecision(2) << out.metrics.total_cost
          << " avg_safety=" << std::setprecision(3) << out.metrics.avg_safety;
  log(LogLevel::INFO, kComponent, summary.str());

  if (out.report.feasible()) {
    out.status = ResultCode::Ok;
    out.message = "all constraints satisfied";
  } else {
    out.status = ResultCode::ConstraintUnsatisfied;
    out.message = out.report.summary();
    for (const auto& c : out.report.checks) {
      if (!c.pass) log(LogLevel::WARN, kComponent, "[" + scenario.label + "] " + c.constraint_id + ": " + c.message);
    }
  }
  return out;
}

}  // namespace fleetopt
