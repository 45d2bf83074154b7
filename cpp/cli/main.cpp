/*
================================================================================
Fragment 6.0 — CLI: Main Entry Point (fleetopt_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line interface for the fleet selection engine.
  - Loads a vessel CSV, reprices it for the requested carbon price, and
    runs one selection or analytics query (or all of them).

Usage:
  fleetopt_cli <command> --vessels <csv> [options]

Commands:
  select       Greedy two-phase selection + validation
  optimize     Exact minimum-cost fleet (branch-and-bound)
  sweep-size   Min cost for each fixed fleet size
  pareto       Min cost for each safety threshold
  dominate     Search for a fleet beating the greedy fleet on cost and safety
  claim        Check a (fleet size, safety, cost) claim
  sensitivity  Base / safety 4.0 / carbon x2 comparison
  experiments  All of the above
  help         Show help message

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures: every fault maps to a tagged exit code
  - Deterministic output format
================================================================================
*/

#include "engine/analysis/scenario_runner.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_fingerprint.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/settings.hpp"
#include "engine/exports/report_csv.hpp"
#include "engine/optimization/fleet_program.hpp"
#include "engine/provider/vessel_provider.hpp"
#include "engine/selection/greedy_selector.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace fleetopt;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  MALFORMED_INPUT = 2,
  INFEASIBLE = 3,
  IO_ERROR = 4,
  CONSTRAINT_UNSATISFIED = 5,
  COMPUTATION_FAILED = 6
};

static void print_help() {
  std::cout << R"(
fleetopt_cli - Constrained Fleet Selection & Optimization Engine

Usage:
  fleetopt_cli <command> --vessels <csv> [options]

Commands:
  select        Greedy selection (seed by fuel type, fill by cost per DWT)
  optimize      Exact minimum-cost fleet
  sweep-size    Minimum cost for each fixed fleet size
  pareto        Minimum cost for each safety threshold
  dominate      Look for a fleet that beats the greedy fleet on both axes
  claim         Check a fleet-size / safety / cost claim
  sensitivity   Base, safety 4.0 and doubled carbon price scenarios
  experiments   Run every query above
  help          Show this help message

Common options:
  --vessels <csv>         Vessel metrics table (required)
  --safety <x>            Safety floor (default 3.0)
  --cargo <dwt>           Cargo requirement in DWT (default 54.92e6 / 12)
  --carbon-price <usd>    Carbon price per t CO2-eq (default 80)
  --out-dir <dir>         Write CSV reports into <dir>
  --workers <n>           Worker threads for sweeps (default 1)
  --node-limit <n>        Branch-and-bound node cap, 0 = none (default 0)
  --log-level <lvl>       debug | info | warn | error (default info)
  --log-file <path>       Mirror log lines into <path>

Query options:
  --fleet-size <n>        optimize / pareto: fixed fleet size; claim: claimed size (22)
  --max-size <n>          optimize: maximum fleet size
  --size-min <n>          sweep-size lower bound (default 18)
  --size-max <n>          sweep-size upper bound (default 26)
  --thresholds <a,b,..>   pareto safety thresholds (default 3.0,3.2,...,5.0)
  --claim-safety <x>      claim: safety floor (default 4.0)
  --claim-cost <usd>      claim: cost ceiling (default 20300000)
  --team-name <name>      submission summary team name

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Malformed input
  3 - Infeasible scenario
  4 - I/O error
  5 - Constraint unsatisfied (greedy)
  6 - Computation failed
)";
}

struct Args {
  std::string command;
  std::string vessels_path;
  double safety = kDefaultSafetyFloor;
  double cargo = kMonthlyCargoRequirementDwt;
  double carbon_price = kDefaultCarbonPriceUsdPerT;
  std::string out_dir;
  int workers = 1;
  std::uint64_t node_limit = 0;
  LogLevel log_level = LogLevel::INFO;
  std::string log_file;

  std::optional<int> fleet_size;
  std::optional<int> max_size;
  int size_min = 18;
  int size_max = 26;
  std::vector<double> thresholds = {3.0, 3.2, 3.4, 3.6, 3.8, 4.0, 4.2, 4.4, 4.6, 4.8, 5.0};
  double claim_safety = 4.0;
  double claim_cost = 20'300'000.0;
  std::string team_name = "fleetopt";
};

static bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

static bool parse_int(const char* s, long long lo, long long hi, long long* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long long v = std::strtoll(s, &end, 10);
  if (end == s || *end != '\0' || v < lo || v > hi) return false;
  *out = v;
  return true;
}

static bool parse_list(const char* s, std::vector<double>* out) {
  if (!s || !out) return false;
  std::vector<double> vals;
  std::string cur;
  const std::string in(s);
  for (std::size_t i = 0; i <= in.size(); ++i) {
    if (i == in.size() || in[i] == ',') {
      double d = 0.0;
      if (!parse_double(cur.c_str(), &d)) return false;
      vals.push_back(d);
      cur.clear();
    } else {
      cur += in[i];
    }
  }
  *out = std::move(vals);
  return true;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }

    long long n = 0;
    double d = 0.0;

    if (std::strcmp(k, "--vessels") == 0) {
      a->vessels_path = v;
    } else if (std::strcmp(k, "--safety") == 0) {
      if (!parse_double(v, &a->safety)) { *err = "--safety must be a finite number"; return false; }
    } else if (std::strcmp(k, "--cargo") == 0) {
      if (!parse_double(v, &a->cargo) || a->cargo <= 0.0) { *err = "--cargo must be > 0"; return false; }
    } else if (std::strcmp(k, "--carbon-price") == 0) {
      if (!parse_double(v, &a->carbon_price) || a->carbon_price < 0.0) { *err = "--carbon-price must be >= 0"; return false; }
    } else if (std::strcmp(k, "--out-dir") == 0) {
      a->out_dir = v;
    } else if (std::strcmp(k, "--workers") == 0) {
      if (!parse_int(v, 1, 256, &n)) { *err = "--workers must be in [1, 256]"; return false; }
      a->workers = static_cast<int>(n);
    } else if (std::strcmp(k, "--node-limit") == 0) {
      if (!parse_int(v, 0, INT64_MAX, &n)) { *err = "--node-limit must be >= 0"; return false; }
      a->node_limit = static_cast<std::uint64_t>(n);
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!parse_log_level(v, &a->log_level)) { *err = "--log-level must be debug|info|warn|error"; return false; }
    } else if (std::strcmp(k, "--log-file") == 0) {
      a->log_file = v;
    } else if (std::strcmp(k, "--fleet-size") == 0) {
      if (!parse_int(v, 0, 1000000, &n)) { *err = "--fleet-size must be >= 0"; return false; }
      a->fleet_size = static_cast<int>(n);
    } else if (std::strcmp(k, "--max-size") == 0) {
      if (!parse_int(v, 0, 1000000, &n)) { *err = "--max-size must be >= 0"; return false; }
      a->max_size = static_cast<int>(n);
    } else if (std::strcmp(k, "--size-min") == 0) {
      if (!parse_int(v, 0, 1000000, &n)) { *err = "--size-min must be >= 0"; return false; }
      a->size_min = static_cast<int>(n);
    } else if (std::strcmp(k, "--size-max") == 0) {
      if (!parse_int(v, 0, 1000000, &n)) { *err = "--size-max must be >= 0"; return false; }
      a->size_max = static_cast<int>(n);
    } else if (std::strcmp(k, "--thresholds") == 0) {
      if (!parse_list(v, &a->thresholds) || a->thresholds.empty()) { *err = "--thresholds must be a comma-separated list"; return false; }
    } else if (std::strcmp(k, "--claim-safety") == 0) {
      if (!parse_double(v, &d)) { *err = "--claim-safety must be a finite number"; return false; }
      a->claim_safety = d;
    } else if (std::strcmp(k, "--claim-cost") == 0) {
      if (!parse_double(v, &d)) { *err = "--claim-cost must be a finite number"; return false; }
      a->claim_cost = d;
    } else if (std::strcmp(k, "--team-name") == 0) {
      a->team_name = v;
    } else {
      *err = std::string("Unknown argument: ") + k;
      return false;
    }
  }

  if (a->vessels_path.empty()) { *err = "Missing --vessels"; return false; }
  if (a->size_min > a->size_max) { *err = "--size-min must be <= --size-max"; return false; }
  return true;
}

// ----------------------------------------------------------------------------

struct Context {
  Args args;
  Scenario scenario;
  RunSettings settings;
  VesselTable table;
};

static std::string money(double x) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << x;
  return o.str();
}

static void print_metrics(const char* title, const FleetMetrics& m) {
  std::cout << title << "\n"
            << "  Fleet size:    " << m.size << "\n"
            << "  Total DWT:     " << std::fixed << std::setprecision(0) << m.total_dwt << "\n"
            << "  Total cost:    " << money(m.total_cost) << "\n"
            << "  Avg safety:    " << std::setprecision(3) << m.avg_safety << "\n"
            << "  Fuel types:    " << m.fuel_type_count() << " (" << fuel_set_to_string(m.fuel_coverage) << ")\n"
            << "  CO2-eq:        " << std::setprecision(2) << m.total_co2_eq << "\n"
            << "  Fuel total:    " << m.total_fuel << "\n";
}

static std::string out_path(const Context& ctx, const std::string& file) {
  return (std::filesystem::path(ctx.args.out_dir) / file).string();
}

static bool writing(const Context& ctx) { return !ctx.args.out_dir.empty(); }

static int cmd_select(const Context& ctx) {
  std::cout << "=== Greedy Selection [" << ctx.scenario.label << "] ===\n";
  const GreedyResult g = select_greedy(ctx.table, ctx.scenario);

  if (!g.fleet) {
    std::cerr << "Greedy selection INFEASIBLE: " << g.message << "\n";
    return ExitCode::INFEASIBLE;
  }

  print_metrics("Greedy fleet:", g.metrics);
  std::cout << "  Fleet hash:    " << hash_to_hex(hash_fleet_ids(g.fleet->ids())) << "\n";
  std::cout << "  Checks:        " << g.report.summary() << "\n";

  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "greedy_fleet.csv"),
                   [&](std::ostream& os) { write_fleet_roster_csv(os, ctx.table, *g.fleet, g.log); });
    write_csv_file(out_path(ctx, "selection_log.csv"),
                   [&](std::ostream& os) { write_selection_log_csv(os, g.log); });
    write_csv_file(out_path(ctx, "greedy_validation.csv"),
                   [&](std::ostream& os) { write_feasibility_csv(os, g.report); });
    SubmissionInfo info;
    info.team_name = ctx.args.team_name;
    write_csv_file(out_path(ctx, ctx.args.team_name + "_submission.csv"),
                   [&](std::ostream& os) { write_submission_csv(os, g.metrics, info); });
  }

  if (g.status == ResultCode::ConstraintUnsatisfied) {
    std::cerr << "Greedy fleet violates a constraint: " << g.message << "\n"
              << "Use 'optimize' for a constraint-complete fleet.\n";
    return ExitCode::CONSTRAINT_UNSATISFIED;
  }
  return ExitCode::SUCCESS;
}

static int cmd_optimize(const Context& ctx) {
  std::cout << "=== Exact Optimization [" << ctx.scenario.label << "] ===\n";

  FleetProgram p = FleetProgram::minimize_cost("milp_" + ctx.scenario.label);
  p.fixed_fleet_size = ctx.args.fleet_size;
  p.max_fleet_size = ctx.args.max_size;
  const SolveResult r = solve_fleet_program(ctx.table, ctx.scenario, p, ctx.settings.solver);

  std::cout << "Status: " << to_string(r.status) << " (" << r.message << ")\n";
  if (!r.fleet) {
    return (r.status == SolveStatus::NodeLimit) ? ExitCode::COMPUTATION_FAILED : ExitCode::INFEASIBLE;
  }

  print_metrics("Optimal fleet:", r.metrics);
  std::cout << "  Fleet hash:    " << hash_to_hex(hash_fleet_ids(r.fleet->ids())) << "\n"
            << "  Nodes:         " << r.certificate.nodes_explored << "\n"
            << "  Lower bound:   " << money(r.certificate.proven_lower_bound) << "\n";

  const GreedyResult g = select_greedy(ctx.table, ctx.scenario);
  if (const auto gap = analysis::heuristic_gap(g, r)) {
    std::cout << "  Savings vs greedy: " << money(gap->savings) << " (" << std::setprecision(2)
              << gap->savings_pct << "%)\n";
  }

  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "milp_optimal_fleet.csv"),
                   [&](std::ostream& os) { write_fleet_roster_csv(os, ctx.table, *r.fleet); });
    const FeasibilityReport rep = evaluate_feasibility(ctx.table, ctx.scenario, *r.fleet);
    write_csv_file(out_path(ctx, "milp_validation.csv"),
                   [&](std::ostream& os) { write_feasibility_csv(os, rep); });
  }
  return ExitCode::SUCCESS;
}

static int cmd_sweep_size(const Context& ctx) {
  std::cout << "=== Fleet-Size Sweep ===\n";
  const auto rows = analysis::fleet_size_sweep(ctx.table, ctx.scenario, ctx.args.size_min, ctx.args.size_max, ctx.settings);
  for (const auto& r : rows) {
    std::cout << "  N=" << static_cast<int>(r.parameter) << ": "
              << (r.feasible ? "cost=" + money(r.total_cost) : std::string(to_string(r.status))) << "\n";
  }
  if (writing(ctx)) {
    const auto marg = analysis::marginal_cost_per_vessel(rows);
    write_csv_file(out_path(ctx, "fleet_size_sweep.csv"), [&](std::ostream& os) { write_analytics_csv(os, rows); });
    write_csv_file(out_path(ctx, "marginal_cost_per_vessel.csv"), [&](std::ostream& os) { write_marginal_csv(os, marg); });
  }
  return ExitCode::SUCCESS;
}

static int cmd_pareto(const Context& ctx) {
  std::cout << "=== Pareto Frontier ===\n";
  std::vector<analysis::FleetSizeRule> rules = {analysis::FleetSizeRule::unconstrained()};
  if (ctx.args.fleet_size) rules.push_back(analysis::FleetSizeRule::fixed(*ctx.args.fleet_size));

  analysis::AnalyticsTable all;
  std::vector<analysis::MarginalRow> marg;
  bool monotone = true;
  for (const auto& rule : rules) {
    const auto rows = analysis::pareto_frontier(ctx.table, ctx.scenario, ctx.args.thresholds, rule, ctx.settings);
    const auto mc = analysis::frontier_is_monotone(rows);
    monotone = monotone && mc.ok;
    std::cout << "[" << rule.name() << "] " << mc.message << "\n";
    for (const auto& r : rows) {
      std::cout << "  safety>=" << std::fixed << std::setprecision(2) << r.parameter << ": "
                << (r.feasible ? "cost=" + money(r.total_cost) + " fleet=" + std::to_string(r.fleet_size)
                               : std::string(to_string(r.status)))
                << "\n";
    }
    const auto m = analysis::marginal_cost_per_safety(rows);
    marg.insert(marg.end(), m.begin(), m.end());
    all.insert(all.end(), rows.begin(), rows.end());
  }

  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "pareto.csv"), [&](std::ostream& os) { write_analytics_csv(os, all); });
    write_csv_file(out_path(ctx, "marginal_cost_per_safety.csv"), [&](std::ostream& os) { write_marginal_csv(os, marg); });
  }
  return monotone ? ExitCode::SUCCESS : ExitCode::COMPUTATION_FAILED;
}

static int cmd_dominate(const Context& ctx) {
  std::cout << "=== Domination Search ===\n";
  const GreedyResult g = select_greedy(ctx.table, ctx.scenario);
  if (!g.fleet) {
    std::cerr << "No greedy baseline: " << g.message << "\n";
    return ExitCode::INFEASIBLE;
  }

  const auto res = analysis::domination_search(ctx.table, ctx.scenario, g.metrics, ctx.settings);
  std::cout << "Baseline: cost=" << money(res.baseline_cost) << " safety=" << std::setprecision(3)
            << res.baseline_safety << "\n"
            << res.verdict << "\n";

  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "domination_search.csv"), [&](std::ostream& os) { write_analytics_csv(os, res.probes); });
  }
  return ExitCode::SUCCESS;
}

static int cmd_claim(const Context& ctx) {
  std::cout << "=== Claim Check ===\n";
  analysis::Claim claim;
  if (ctx.args.fleet_size) claim.fleet_size = *ctx.args.fleet_size;
  claim.safety_floor = ctx.args.claim_safety;
  claim.cost_ceiling = ctx.args.claim_cost;

  const auto v = analysis::check_claim(ctx.table, ctx.scenario, claim, ctx.settings);
  std::cout << "Claim: fleet=" << claim.fleet_size << " safety>=" << std::setprecision(2) << claim.safety_floor
            << " cost<=" << money(claim.cost_ceiling) << "\n"
            << "Exact claim feasible: " << (v.feasible ? "yes" : "no") << "\n";
  if (v.best_cost_at_target) {
    std::cout << "Best cost at target: " << money(*v.best_cost_at_target) << " (gap " << money(v.gap_to_claim)
              << ", " << std::setprecision(1) << v.gap_pct << "%)\n";
  } else {
    std::cout << v.note << "\n";
  }
  if (v.min_cost_any_size) {
    std::cout << "Min cost at any size: " << money(*v.min_cost_any_size) << " (fleet=" << v.fleet_size_at_min_cost << ")\n";
  }

  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "claim_check.csv"), [&](std::ostream& os) { write_claim_csv(os, v); });
  }
  return ExitCode::SUCCESS;
}

static int cmd_sensitivity(const Context& ctx, const VesselMetricsProvider& provider) {
  std::cout << "=== Sensitivity ===\n";
  const auto rows = analysis::run_sensitivity(provider, analysis::default_sensitivity_scenarios(ctx.scenario), ctx.settings);
  for (const auto& r : rows) {
    std::cout << "  [" << r.label << "] greedy=" << to_string(r.greedy_status)
              << (r.greedy_has_fleet ? " cost=" + money(r.greedy.total_cost) : std::string())
              << " optimal=" << to_string(r.optimal_status)
              << (r.optimal_has_fleet ? " cost=" + money(r.optimal.total_cost) : std::string()) << "\n";
  }
  if (writing(ctx)) {
    write_csv_file(out_path(ctx, "sensitivity.csv"), [&](std::ostream& os) { write_sensitivity_csv(os, rows); });
  }
  return ExitCode::SUCCESS;
}

// Runs every query; the first non-zero code wins, later queries still run.
static int cmd_experiments(const Context& ctx, const VesselMetricsProvider& provider) {
  int rc = ExitCode::SUCCESS;
  auto keep = [&rc](int code) {
    if (rc == ExitCode::SUCCESS) rc = code;
  };
  keep(cmd_select(ctx));
  keep(cmd_optimize(ctx));
  keep(cmd_sweep_size(ctx));
  keep(cmd_pareto(ctx));
  keep(cmd_dominate(ctx));
  keep(cmd_claim(ctx));
  keep(cmd_sensitivity(ctx, provider));
  return rc;
}

static int run(const Args& args) {
  set_log_level(args.log_level);
  if (!args.log_file.empty() && !set_log_file(args.log_file)) {
    std::cerr << "Cannot open log file: " << args.log_file << "\n";
    return ExitCode::IO_ERROR;
  }

  if (!args.out_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(args.out_dir, ec);
    if (ec) {
      std::cerr << "Cannot create output directory '" << args.out_dir << "': " << ec.message() << "\n";
      return ExitCode::IO_ERROR;
    }
  }

  const CostTableProvider provider(load_vessel_records_csv(args.vessels_path));

  Context ctx;
  ctx.args = args;
  ctx.scenario.label = "base";
  ctx.scenario.safety_floor = args.safety;
  ctx.scenario.cargo_requirement_dwt = args.cargo;
  ctx.scenario.carbon_price_usd_per_t = args.carbon_price;
  ctx.scenario.validate_or_throw();

  ctx.settings.workers = args.workers;
  ctx.settings.solver.node_limit = args.node_limit;
  ctx.settings.validate_or_throw();

  ctx.table = provider.vessels_for(ctx.scenario);
  log(LogLevel::INFO, "cli",
      "vessels=" + std::to_string(ctx.table.size()) + " input=" + run_input_fingerprint_hex(ctx.table, ctx.scenario));

  const std::string& c = args.command;
  if (c == "select")      return cmd_select(ctx);
  if (c == "optimize")    return cmd_optimize(ctx);
  if (c == "sweep-size")  return cmd_sweep_size(ctx);
  if (c == "pareto")      return cmd_pareto(ctx);
  if (c == "dominate")    return cmd_dominate(ctx);
  if (c == "claim")       return cmd_claim(ctx);
  if (c == "sensitivity") return cmd_sensitivity(ctx, provider);
  return cmd_experiments(ctx, provider);
}

int main(int argc, char** argv) {
  // Parse command
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  static const char* const kCommands[] = {"select", "dominate", "optimize", "sweep-size",
                                          "pareto", "claim", "sensitivity", "experiments"};
  bool known = false;
  for (const char* k : kCommands) known = known || cmd == k;
  if (!known) {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'fleetopt_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  Args args;
  args.command = cmd;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << "Error: " << err << "\n";
    std::cerr << "Run 'fleetopt_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  int rc = ExitCode::COMPUTATION_FAILED;
  try {
    rc = run(args);
  } catch (const MalformedInputError& e) {
    std::cerr << "Malformed input: " << e.what() << "\n";
    rc = ExitCode::MALFORMED_INPUT;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    rc = ExitCode::IO_ERROR;
  } catch (const NumericalError& e) {
    std::cerr << "Numerical failure: " << e.what() << "\n";
    rc = ExitCode::COMPUTATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    rc = ExitCode::COMPUTATION_FAILED;
  }
  close_log_file();
  return rc;
}
