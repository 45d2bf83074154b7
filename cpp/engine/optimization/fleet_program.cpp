#include "engine/optimization/fleet_program.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

#include "ortools/linear_solver/linear_solver.h"

#include "engine/core/logging.hpp"

namespace fleetopt {

namespace {

namespace ort = operations_research;

constexpr const char* kComponent = "optimizer";
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kCeilingRelTol = 1e-9;

struct Node {
  std::vector<std::int8_t> fix;  // -1 free, 0, 1
  double parent_bound = -kInf;
};

double effective_ceiling(double c) {
  return c + kCeilingRelTol * std::max(1.0, std::fabs(c));
}

void validate_program(const FleetProgram& p) {
  if (p.fixed_fleet_size && *p.fixed_fleet_size < 0) {
    throw MalformedInputError("FleetProgram '" + p.label + "': fixed_fleet_size must be >= 0");
  }
  if (p.max_fleet_size && *p.max_fleet_size < 0) {
    throw MalformedInputError("FleetProgram '" + p.label + "': max_fleet_size must be >= 0");
  }
  if (p.cost_ceiling && !std::isfinite(*p.cost_ceiling)) {
    throw MalformedInputError("FleetProgram '" + p.label + "': cost_ceiling must be finite");
  }
}

// LP relaxation of one program, loaded into GLOP once. A node only moves
// column bounds, so GLOP re-solves from the previous basis.
class NodeRelaxation {
 public:
  enum class Outcome { Optimal, Infeasible };

  NodeRelaxation(const VesselTable& table,
                 const Scenario& scenario,
                 const FleetProgram& program,
                 const SolverSettings& settings)
      : solver_("fleet_" + program.label, ort::MPSolver::GLOP_LINEAR_PROGRAMMING), label_(program.label) {
    const std::size_t n = table.size();
    const double inf = ort::MPSolver::infinity();

    x_.reserve(n);
    for (std::size_t j = 0; j < n; ++j) {
      x_.push_back(solver_.MakeNumVar(0.0, 1.0, "x_" + std::to_string(table.at(j).id)));
    }

    ort::MPConstraint* cap = solver_.MakeRowConstraint(scenario.cargo_requirement_dwt, inf, "CAPACITY");
    ort::MPConstraint* safety = solver_.MakeRowConstraint(0.0, inf, "SAFETY");
    for (std::size_t j = 0; j < n; ++j) {
      cap->SetCoefficient(x_[j], table.at(j).dwt);
      safety->SetCoefficient(x_[j], table.at(j).safety_score - scenario.safety_floor);
    }

    for (FuelType f : kAllFuelTypes) {
      if (!scenario.required_fuel_types.test(fuel_index(f))) continue;
      ort::MPConstraint* r = solver_.MakeRowConstraint(1.0, inf, std::string("FUEL.") + fuel_type_name(f));
      for (std::size_t j : table.indices_of_fuel(f)) r->SetCoefficient(x_[j], 1.0);
    }

    if (program.fixed_fleet_size) {
      const double size = static_cast<double>(*program.fixed_fleet_size);
      ort::MPConstraint* r = solver_.MakeRowConstraint(size, size, "SIZE.FIXED");
      for (ort::MPVariable* v : x_) r->SetCoefficient(v, 1.0);
    }
    if (program.max_fleet_size) {
      ort::MPConstraint* r =
          solver_.MakeRowConstraint(-inf, static_cast<double>(*program.max_fleet_size), "SIZE.MAX");
      for (ort::MPVariable* v : x_) r->SetCoefficient(v, 1.0);
    }
    if (program.cost_ceiling) {
      ort::MPConstraint* r = solver_.MakeRowConstraint(-inf, effective_ceiling(*program.cost_ceiling), "COST_CEILING");
      for (std::size_t j = 0; j < n; ++j) r->SetCoefficient(x_[j], table.at(j).adjusted_cost);
    }

    ort::MPObjective* obj = solver_.MutableObjective();
    if (program.objective == ObjectiveKind::MinimizeCost) {
      for (std::size_t j = 0; j < n; ++j) obj->SetCoefficient(x_[j], table.at(j).adjusted_cost);
    }
    obj->SetMinimization();

    params_.SetDoubleParam(ort::MPSolverParameters::PRIMAL_TOLERANCE, settings.feasibility_tol);
    const std::string glop = "max_number_of_iterations: " + std::to_string(settings.max_lp_iterations);
    if (!solver_.SetSolverSpecificParametersAsString(glop)) {
      FLEETOPT_THROW(NumericalError, "FleetProgram '" + label_ + "': GLOP rejected '" + glop + "'");
    }
  }

  // Fixed columns get equal bounds; free columns go back to [0, 1].
  Outcome solve(const std::vector<std::int8_t>& fix, std::uint64_t node) {
    for (std::size_t j = 0; j < x_.size(); ++j) {
      if (fix[j] >= 0) x_[j]->SetBounds(fix[j], fix[j]);
      else x_[j]->SetBounds(0.0, 1.0);
    }
    const ort::MPSolver::ResultStatus status = solver_.Solve(params_);
    if (status == ort::MPSolver::OPTIMAL) return Outcome::Optimal;
    if (status == ort::MPSolver::INFEASIBLE) return Outcome::Infeasible;
    FLEETOPT_THROW(NumericalError, "FleetProgram '" + label_ + "': GLOP status " +
                                       std::to_string(static_cast<int>(status)) + " at node " +
                                       std::to_string(node));
  }

  double objective() const { return solver_.Objective().Value(); }
  double value(std::size_t j) const { return x_[j]->solution_value(); }
  std::uint64_t iterations() const { return static_cast<std::uint64_t>(solver_.iterations()); }

 private:
  ort::MPSolver solver_;
  std::vector<ort::MPVariable*> x_;
  ort::MPSolverParameters params_;
  std::string label_;
};

// Final integral check: hard constraints plus the program's own rows.
bool accept_integral(const Scenario& scenario, const FleetProgram& program, const VesselTable& table,
                     const FleetMetrics& m) {
  if (!evaluate_feasibility(table, scenario, m).feasible()) return false;
  if (program.fixed_fleet_size && m.size != static_cast<std::size_t>(*program.fixed_fleet_size)) return false;
  if (program.max_fleet_size && m.size > static_cast<std::size_t>(*program.max_fleet_size)) return false;
  if (program.cost_ceiling && m.total_cost > effective_ceiling(*program.cost_ceiling)) return false;
  return true;
}

std::string describe(const SolveResult& r) {
  std::ostringstream o;
  o << r.label << ": status=" << to_string(r.status);
  if (r.fleet) {
    o << std::fixed << std::setprecision(2)
      << " cost=" << r.metrics.total_cost
      << " safety=" << r.metrics.avg_safety
      << " fleet=" << r.metrics.size
      << " DWT=" << std::setprecision(0) << r.metrics.total_dwt;
  }
  o << " nodes=" << r.certificate.nodes_explored
    << " time=" << std::fixed << std::setprecision(3) << r.solve_seconds << "s";
  return o.str();
}

}  // namespace

ResultCode SolveResult::code() const noexcept {
  switch (status) {
    case SolveStatus::Optimal:
    case SolveStatus::Feasible:   return ResultCode::Ok;
    case SolveStatus::Infeasible: return ResultCode::InfeasibleScenario;
    case SolveStatus::NodeLimit:  return ResultCode::NodeLimit;
    default:                      return ResultCode::InfeasibleScenario;
  }
}

SolveResult solve_fleet_program(const VesselTable& table,
                                const Scenario& scenario,
                                const FleetProgram& program,
                                const SolverSettings& settings) {
  scenario.validate_or_throw();
  settings.validate_or_throw();
  validate_program(program);

  const auto t0 = std::chrono::steady_clock::now();
  auto finish = [&](SolveResult& r) {
    r.solve_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    const LogLevel lvl = (r.status == SolveStatus::NodeLimit) ? LogLevel::WARN : LogLevel::INFO;
    log(lvl, kComponent, describe(r));
    return r;
  };

  SolveResult out;
  out.label = program.label;

  const FuelSet missing = scenario.required_fuel_types & ~table.fuel_types_present();
  if (missing.any()) {
    out.status = SolveStatus::Infeasible;
    out.message = "no vessel for required fuel types: " + fuel_set_to_string(missing);
    return finish(out);
  }

  NodeRelaxation relaxation(table, scenario, program, settings);
  const std::size_t n = table.size();

  const bool minimize = program.objective == ObjectiveKind::MinimizeCost;

  std::vector<Node> stack;
  stack.push_back(Node{std::vector<std::int8_t>(n, -1), -kInf});

  std::optional<std::vector<std::size_t>> best;
  FleetMetrics best_metrics;
  double incumbent = kInf;
  bool stopped = false;
  bool found_feasible = false;
  SolveCertificate& cert = out.certificate;

  while (!stack.empty()) {
    if (settings.node_limit != 0 && cert.nodes_explored >= settings.node_limit) {
      stopped = true;
      break;
    }

    Node node = std::move(stack.back());
    stack.pop_back();
    ++cert.nodes_explored;

    if (best && node.parent_bound >= incumbent - settings.optimality_abs_tol) {
      ++cert.pruned_by_bound;
      continue;
    }

    const NodeRelaxation::Outcome lp = relaxation.solve(node.fix, cert.nodes_explored);
    cert.lp_iterations += relaxation.iterations();
    if (lp == NodeRelaxation::Outcome::Infeasible) {
      ++cert.infeasible_nodes;
      continue;
    }
    const double bound = relaxation.objective();
    if (cert.nodes_explored == 1) cert.root_lower_bound = bound;

    if (best && bound >= incumbent - settings.optimality_abs_tol) {
      ++cert.pruned_by_bound;
      continue;
    }

    // Most fractional variable; strict '>' keeps the smallest index on ties.
    std::size_t branch = n;
    double best_frac = settings.integrality_tol;
    for (std::size_t j = 0; j < n; ++j) {
      const double xj = relaxation.value(j);
      const double frac = std::min(xj - std::floor(xj), std::ceil(xj) - xj);
      if (frac > best_frac) {
        best_frac = frac;
        branch = j;
      }
    }

    if (branch == n) {
      std::vector<std::size_t> chosen;
      for (std::size_t j = 0; j < n; ++j) {
        if (relaxation.value(j) > 0.5) chosen.push_back(j);
      }
      const FleetMetrics m = compute_metrics(table, chosen);

      if (accept_integral(scenario, program, table, m)) {
        if (!minimize) {
          best = std::move(chosen);
          best_metrics = m;
          found_feasible = true;
          break;
        }
        if (m.total_cost < incumbent) {
          incumbent = m.total_cost;
          best = std::move(chosen);
          best_metrics = m;
          log(LogLevel::DEBUG, kComponent,
              program.label + ": incumbent " + std::to_string(incumbent) + " at node " +
                  std::to_string(cert.nodes_explored));
        }
        continue;
      }

      // Rounded point misses a constraint by more than the LP tolerance:
      // keep the subtree exact by branching on the first free variable.
      branch = n;
      for (std::size_t j = 0; j < n; ++j) {
        if (node.fix[j] < 0) {
          branch = j;
          break;
        }
      }
      if (branch == n) {
        ++cert.infeasible_nodes;
        continue;
      }
    }

    Node down{node.fix, bound};
    down.fix[branch] = 0;
    Node up{std::move(node.fix), bound};
    up.fix[branch] = 1;
    stack.push_back(std::move(down));
    stack.push_back(std::move(up));
  }

  if (best) {
    out.fleet = Fleet::from_indices(table, *best);
    out.metrics = best_metrics;
    out.objective_value = minimize ? best_metrics.total_cost : 0.0;
  }

  if (stopped) {
    out.status = SolveStatus::NodeLimit;
    double lb = best ? incumbent : kInf;
    for (const auto& open : stack) lb = std::min(lb, open.parent_bound);
    cert.proven_lower_bound = lb;
    cert.gap = best ? incumbent - lb : kInf;
    out.message = "node limit " + std::to_string(settings.node_limit) + " reached" +
                  (best ? "; incumbent is not proven optimal" : "; no feasible fleet found yet");
  } else if (found_feasible) {
    out.status = SolveStatus::Feasible;
    out.message = "feasible fleet found";
  } else if (best) {
    out.status = SolveStatus::Optimal;
    cert.search_exhausted = true;
    cert.proven_lower_bound = incumbent;
    cert.gap = 0.0;
    out.message = "optimal; search exhausted";
  } else {
    out.status = SolveStatus::Infeasible;
    cert.search_exhausted = true;
    out.message = "no fleet satisfies the constraint system";
  }
  return finish(out);
}

}  // namespace fleetopt
