#pragma once
/*
================================================================================
Fragment 1.8 — Core: Scenario (Immutable Policy Bundle)
FILE: cpp/engine/core/scenario.hpp

Purpose:
  - The policy parameters a selection run is evaluated against:
      * safety floor (average fleet safety score)
      * monthly cargo requirement (sum of DWT)
      * required fuel-type coverage
      * carbon price (consumed by the metrics provider only)
  - Passed whole, by const reference, into every call. Variants are new
    values built with the with_*() helpers; nothing mutates a scenario
    in place and there is no process-wide "current scenario".

Provenance of defaults:
  - Cargo requirement: 2024 bunker sales 54.92 Mt / 12 months.
  - Carbon price: 80 USD / t CO2-eq.
================================================================================
*/

#include <cmath>
#include <string>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/fuel_type.hpp"

namespace fleetopt {

inline constexpr double kAnnualBunkerSalesT = 54.92e6;
inline constexpr double kMonthlyCargoRequirementDwt = kAnnualBunkerSalesT / 12.0;
inline constexpr double kDefaultSafetyFloor = 3.0;
inline constexpr double kDefaultCarbonPriceUsdPerT = 80.0;

struct Scenario {
  std::string label = "base";
  double safety_floor = kDefaultSafetyFloor;
  double cargo_requirement_dwt = kMonthlyCargoRequirementDwt;
  FuelSet required_fuel_types = all_fuel_types();
  double carbon_price_usd_per_t = kDefaultCarbonPriceUsdPerT;

  void validate_or_throw() const {
    if (!std::isfinite(safety_floor)) {
      throw MalformedInputError("Scenario '" + label + "': safety_floor must be finite");
    }
    if (!std::isfinite(cargo_requirement_dwt) || cargo_requirement_dwt <= 0.0) {
      throw MalformedInputError("Scenario '" + label + "': cargo_requirement_dwt must be > 0");
    }
    if (!std::isfinite(carbon_price_usd_per_t) || carbon_price_usd_per_t < 0.0) {
      throw MalformedInputError("Scenario '" + label + "': carbon_price_usd_per_t must be >= 0");
    }
  }

  Scenario with_label(std::string l) const {
    Scenario s = *this;
    s.label = std::move(l);
    return s;
  }

  Scenario with_safety_floor(double floor) const {
    Scenario s = *this;
    s.safety_floor = floor;
    return s;
  }

  Scenario with_carbon_price(double usd_per_t) const {
    Scenario s = *this;
    s.carbon_price_usd_per_t = usd_per_t;
    return s;
  }

  static Scenario defaults() {
    Scenario s;
    return s;
  }
};

}  // namespace fleetopt
