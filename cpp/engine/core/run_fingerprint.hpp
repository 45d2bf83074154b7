#pragma once
/*
================================================================================
Fragment 1.12 — Core: Run Fingerprints (Deterministic)
FILE: cpp/engine/core/run_fingerprint.hpp

Purpose:
  - Fingerprint the three inputs/outputs that define a selection result:
      * the vessel table it was selected from
      * the scenario it was selected under
      * the fleet (set of vessel ids) it produced
  - Stored in exported reports and printed by the CLI so two runs can be
    compared without diffing whole CSV files.

Hardening:
  - Stable field order + tagged sections.
  - Fleet hash is order-independent (ids sorted before hashing).
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/hashing.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/vessel.hpp"

namespace fleetopt {

Hash64 hash_vessel_table(const VesselTable& table);
Hash64 hash_scenario(const Scenario& scenario);
Hash64 hash_fleet_ids(std::vector<VesselId> ids);

// table (+) scenario: identifies the input of a run.
std::string run_input_fingerprint_hex(const VesselTable& table, const Scenario& scenario);

}  // namespace fleetopt
