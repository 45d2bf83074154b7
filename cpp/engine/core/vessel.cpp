#include "engine/core/vessel.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "engine/core/errors.hpp"

namespace fleetopt {

namespace {

std::string vessel_tag(VesselId id) {
  return "Vessel " + std::to_string(id) + ": ";
}

}  // namespace

void Vessel::validate_or_throw() const {
  if (!std::isfinite(dwt) || dwt <= 0.0) {
    throw MalformedInputError(vessel_tag(id) + "dwt must be finite and > 0");
  }
  if (!std::isfinite(safety_score)) {
    throw MalformedInputError(vessel_tag(id) + "safety_score must be finite");
  }
  if (!std::isfinite(adjusted_cost) || adjusted_cost < 0.0) {
    throw MalformedInputError(vessel_tag(id) + "adjusted_cost must be finite and >= 0");
  }
  if (!std::isfinite(co2_eq) || co2_eq < 0.0) {
    throw MalformedInputError(vessel_tag(id) + "co2_eq must be finite and >= 0");
  }
  if (!std::isfinite(fuel_total) || fuel_total < 0.0) {
    throw MalformedInputError(vessel_tag(id) + "fuel_total must be finite and >= 0");
  }
  if (fuel_index(main_fuel_type) >= kFuelTypeCount) {
    throw MalformedInputError(vessel_tag(id) + "main_fuel_type outside catalogue");
  }
}

VesselTable::VesselTable(std::vector<Vessel> vessels) : vessels_(std::move(vessels)) {
  for (const auto& v : vessels_) v.validate_or_throw();

  std::sort(vessels_.begin(), vessels_.end(),
            [](const Vessel& a, const Vessel& b) { return a.id < b.id; });

  for (std::size_t i = 1; i < vessels_.size(); ++i) {
    if (vessels_[i].id == vessels_[i - 1].id) {
      throw MalformedInputError("VesselTable: duplicate vessel id " + std::to_string(vessels_[i].id));
    }
  }
}

const Vessel* VesselTable::find(VesselId id) const noexcept {
  const auto idx = index_of(id);
  return idx ? &vessels_[*idx] : nullptr;
}

std::optional<std::size_t> VesselTable::index_of(VesselId id) const noexcept {
  auto it = std::lower_bound(vessels_.begin(), vessels_.end(), id,
                             [](const Vessel& v, VesselId key) { return v.id < key; });
  if (it == vessels_.end() || it->id != id) return std::nullopt;
  return static_cast<std::size_t>(it - vessels_.begin());
}

std::vector<std::size_t> VesselTable::indices_of_fuel(FuelType fuel) const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < vessels_.size(); ++i) {
    if (vessels_[i].main_fuel_type == fuel) out.push_back(i);
  }
  return out;
}

FuelSet VesselTable::fuel_types_present() const noexcept {
  FuelSet s;
  for (const auto& v : vessels_) s.set(fuel_index(v.main_fuel_type));
  return s;
}

double VesselTable::total_dwt() const noexcept {
  double sum = 0.0;
  for (const auto& v : vessels_) sum += v.dwt;
  return sum;
}

}  // namespace fleetopt
