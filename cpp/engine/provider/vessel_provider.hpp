#pragma once
/*
================================================================================
Fragment 1.9 — Provider: Vessel Metrics Providers + CSV Loader
FILE: cpp/engine/provider/vessel_provider.hpp

Purpose:
  - The boundary between the upstream per-vessel cost/emission stages and
    the selection core. A provider turns a Scenario into ONE immutable
    VesselTable; the core never recomputes costs itself.
  - StaticVesselProvider   fixed table, scenario-independent.
  - CostTableProvider      reprices per scenario from a cost decomposition:
        total    = fuel_cost + co2_eq * carbon_price + monthly_ownership_cost
        adjusted = total * (1 + risk_rate(safety_score))
        risk_rate: 1 -> +10%, 2 -> +5%, 3 -> 0, 4 -> -2%, 5 -> -5%
    Records without a decomposition keep their delivered adjusted_cost.

CSV schema (header-driven, column order free, extra columns ignored):
  required  vessel_id, dwt, main_engine_fuel_type, safety_score,
            adjusted_cost, co2eq_total, fuel_total
  optional  fuel_cost, monthly_ownership_cost   (both or neither per row)

Hardening:
  - Malformed rows raise MalformedInputError naming file and line.
  - Unreadable files raise IOError.
  - vessels_for() is const and touches no shared mutable state, so
    sensitivity cases may call it from worker threads.
================================================================================
*/

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/scenario.hpp"
#include "engine/core/vessel.hpp"

namespace fleetopt {

class VesselMetricsProvider {
 public:
  virtual ~VesselMetricsProvider() = default;

  virtual VesselTable vessels_for(const Scenario& scenario) const = 0;
  virtual std::string name() const = 0;
};

class StaticVesselProvider final : public VesselMetricsProvider {
 public:
  explicit StaticVesselProvider(VesselTable table) : table_(std::move(table)) {}

  VesselTable vessels_for(const Scenario& scenario) const override;
  std::string name() const override { return "static"; }

 private:
  VesselTable table_;
};

struct CostDecomposition {
  double fuel_cost = 0.0;               // USD / month
  double monthly_ownership_cost = 0.0;  // USD / month
};

struct VesselRecord {
  Vessel vessel;                             // adjusted_cost as delivered
  std::optional<CostDecomposition> costs;    // enables carbon repricing
};

// Throws MalformedInputError for safety scores outside {1,2,3,4,5}.
double risk_rate(double safety_score);

// Adjusted monthly cost of one record under `carbon_price_usd_per_t`.
double reprice(const VesselRecord& record, double carbon_price_usd_per_t);

class CostTableProvider final : public VesselMetricsProvider {
 public:
  explicit CostTableProvider(std::vector<VesselRecord> records);

  VesselTable vessels_for(const Scenario& scenario) const override;
  std::string name() const override { return "cost-table"; }

  const std::vector<VesselRecord>& records() const noexcept { return records_; }

 private:
  std::vector<VesselRecord> records_;
};

// Header-driven loader. IOError if unreadable, MalformedInputError on bad rows.
std::vector<VesselRecord> load_vessel_records_csv(const std::string& path);

}  // namespace fleetopt
