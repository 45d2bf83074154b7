#pragma once
/*
================================================================================
Fragment 2.1 — Selection: Fleet (Immutable Candidate Set) + Selection Log
FILE: cpp/engine/selection/fleet.hpp

Purpose:
  - Fleet: a set of vessel ids drawn from ONE vessel table.
      * sorted ascending, no duplicates, every id present in the table
      * never mutated after construction (re-runs build a new Fleet)
  - SelectionEntry: one line of the audit trail (who selected a vessel,
    in which phase, at which rank, and why).

Hardening:
  - Fleet::from_ids() rejects unknown and duplicate ids with
    MalformedInputError instead of silently de-duplicating.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/vessel.hpp"

namespace fleetopt {

enum class SelectionPhase : std::uint8_t {
  Seed = 0,   // greedy fuel-type representative
  Fill = 1,   // greedy capacity fill
  Solver = 2  // chosen by the exact optimizer
};

inline const char* to_string(SelectionPhase p) noexcept {
  switch (p) {
    case SelectionPhase::Seed:   return "seed";
    case SelectionPhase::Fill:   return "fill";
    case SelectionPhase::Solver: return "solver";
    default:                     return "unknown";
  }
}

struct SelectionEntry {
  VesselId vessel_id = 0;
  SelectionPhase phase = SelectionPhase::Seed;
  int rank = 0;        // 1-based order of selection within the run
  std::string reason;
};

class Fleet {
 public:
  Fleet() = default;

  // Throws MalformedInputError on unknown or repeated ids.
  static Fleet from_ids(const VesselTable& table, std::vector<VesselId> ids);

  // Same as from_ids() for indices into `table` (used by the optimizer).
  static Fleet from_indices(const VesselTable& table, const std::vector<std::size_t>& indices);

  const std::vector<VesselId>& ids() const noexcept { return ids_; }
  std::size_t size() const noexcept { return ids_.size(); }
  bool empty() const noexcept { return ids_.empty(); }
  bool contains(VesselId id) const noexcept;

  bool operator==(const Fleet& o) const noexcept { return ids_ == o.ids_; }
  bool operator!=(const Fleet& o) const noexcept { return ids_ != o.ids_; }

 private:
  explicit Fleet(std::vector<VesselId> sorted_ids) : ids_(std::move(sorted_ids)) {}

  std::vector<VesselId> ids_;
};

}  // namespace fleetopt
