#pragma once
/*
================================================================================
Fragment 1.4 — Core: Solver + Run Settings (Hardened)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every numerical knob of the exact optimizer and the
    analytics runner into validated objects.
  - Identical Scenario + identical SolverSettings must reproduce the same
    fleet bit for bit; nothing here is randomized.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Conservative defaults: no node limit, tight tolerances.
  - Separate "solver numerics" from "how many workers run a sweep".
================================================================================
*/

#include <cmath>
#include <cstdint>

#include "engine/core/errors.hpp"

namespace fleetopt {

// ----------------------------- Solver ----------------------------------------
struct SolverSettings {
  // |x - round(x)| below this counts as integral.
  double integrality_tol = 1e-6;

  // Primal feasibility tolerance of the GLOP relaxation and of
  // the final integral check (relative to the constraint magnitude).
  double feasibility_tol = 1e-7;

  // A node is pruned when its LP bound >= incumbent - optimality_abs_tol (USD).
  double optimality_abs_tol = 1e-6;

  // Branch-and-bound node cap. 0 = unlimited (the default: no timeout).
  std::uint64_t node_limit = 0;

  // GLOP iteration cap per node relaxation (max_number_of_iterations).
  int max_lp_iterations = 200000;

  void validate_or_throw() const {
    if (!(integrality_tol > 0.0 && integrality_tol < 0.1)) {
      throw MalformedInputError("SolverSettings: integrality_tol must be in (0, 0.1)");
    }
    if (!(feasibility_tol > 0.0 && feasibility_tol < 1e-2)) {
      throw MalformedInputError("SolverSettings: feasibility_tol must be in (0, 1e-2)");
    }
    if (!std::isfinite(optimality_abs_tol) || optimality_abs_tol < 0.0) {
      throw MalformedInputError("SolverSettings: optimality_abs_tol must be >= 0");
    }
    if (max_lp_iterations < 100) {
      throw MalformedInputError("SolverSettings: max_lp_iterations must be >= 100");
    }
  }
};

// ----------------------------- Run -------------------------------------------
// Knobs for the analytics runner (sweeps of independent optimizer calls).
struct RunSettings {
  SolverSettings solver;

  // Worker threads for independent queries. 1 = sequential.
  int workers = 1;

  void validate_or_throw() const {
    solver.validate_or_throw();
    if (workers < 1 || workers > 256) {
      throw MalformedInputError("RunSettings: workers must be in [1, 256]");
    }
  }

  static RunSettings defaults() {
    RunSettings s;
    return s;
  }
};

}  // namespace fleetopt
