#pragma once
/*
================================================================================
Fragment 1.7 — Core: Vessel Record + Immutable Vessel Table
FILE: cpp/engine/core/vessel.hpp

Purpose:
  - One row per vessel as delivered by the metrics provider for ONE scenario
    (adjusted_cost already reflects that scenario's carbon price).
  - VesselTable: validated, id-sorted, read-only view shared by every
    selection / optimizer / analytics call of a run.

Hardening:
  - validate_or_throw() rejects non-positive DWT, negative cost/emissions,
    non-finite values, duplicate ids (MalformedInputError) before any search.
  - Vessels are stored sorted by id: index order == id order, which is the
    stable tie-break used by both selection algorithms.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "engine/core/fuel_type.hpp"

namespace fleetopt {

using VesselId = std::int64_t;

struct Vessel {
  VesselId id = 0;
  double dwt = 0.0;                  // deadweight tonnage (t)
  FuelType main_fuel_type = FuelType::Distillate;
  double safety_score = 0.0;         // typically 1..5
  double adjusted_cost = 0.0;        // USD / month for the active scenario
  double co2_eq = 0.0;               // t CO2-eq / month (informational)
  double fuel_total = 0.0;           // t fuel / month (informational)

  // Ranking key of the greedy selector. Recomputed from the current cost.
  double cost_per_dwt() const { return adjusted_cost / dwt; }

  void validate_or_throw() const;
};

class VesselTable {
 public:
  VesselTable() = default;

  // Validates every row and sorts by id. Throws MalformedInputError.
  explicit VesselTable(std::vector<Vessel> vessels);

  std::size_t size() const noexcept { return vessels_.size(); }
  bool empty() const noexcept { return vessels_.empty(); }

  const Vessel& at(std::size_t index) const { return vessels_.at(index); }
  const std::vector<Vessel>& vessels() const noexcept { return vessels_; }

  // Binary search by id. nullptr / nullopt when absent.
  const Vessel* find(VesselId id) const noexcept;
  std::optional<std::size_t> index_of(VesselId id) const noexcept;

  // Indices (ascending id) of vessels burning `fuel`.
  std::vector<std::size_t> indices_of_fuel(FuelType fuel) const;

  FuelSet fuel_types_present() const noexcept;
  double total_dwt() const noexcept;

 private:
  std::vector<Vessel> vessels_;
};

}  // namespace fleetopt
