#pragma once
/*
================================================================================
Fragment 1.6 — Core: Main-Engine Fuel Type Catalogue
FILE: cpp/engine/core/fuel_type.hpp

Purpose:
  - The 8 categorical main-engine fuel types a fleet must cover.
  - Canonical display names (as used by the reference cost tables).
  - Lenient parsing: case-insensitive, accepts the AIS upper-case spelling
    "DISTILLATE FUEL".

Notes:
  - FuelSet is a fixed-width bitset indexed by the enum value, so coverage
    tests and set differences are branch-free and deterministic.
================================================================================
*/

#include <array>
#include <bitset>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace fleetopt {

enum class FuelType : std::uint8_t {
  Distillate = 0,
  LpgPropane = 1,
  LpgButane = 2,
  Lng = 3,
  Methanol = 4,
  Ethanol = 5,
  Ammonia = 6,
  Hydrogen = 7
};

inline constexpr std::size_t kFuelTypeCount = 8;

using FuelSet = std::bitset<kFuelTypeCount>;

inline constexpr std::array<FuelType, kFuelTypeCount> kAllFuelTypes = {
    FuelType::Distillate, FuelType::LpgPropane, FuelType::LpgButane, FuelType::Lng,
    FuelType::Methanol,   FuelType::Ethanol,    FuelType::Ammonia,   FuelType::Hydrogen};

inline constexpr std::size_t fuel_index(FuelType f) noexcept {
  return static_cast<std::size_t>(f);
}

inline const char* fuel_type_name(FuelType f) noexcept {
  switch (f) {
    case FuelType::Distillate: return "Distillate fuel";
    case FuelType::LpgPropane: return "LPG (Propane)";
    case FuelType::LpgButane:  return "LPG (Butane)";
    case FuelType::Lng:        return "LNG";
    case FuelType::Methanol:   return "Methanol";
    case FuelType::Ethanol:    return "Ethanol";
    case FuelType::Ammonia:    return "Ammonia";
    case FuelType::Hydrogen:   return "Hydrogen";
    default:                   return "Unknown";
  }
}

inline std::optional<FuelType> parse_fuel_type(std::string_view s) noexcept {
  // Trim surrounding blanks.
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);

  for (FuelType f : kAllFuelTypes) {
    const std::string_view name = fuel_type_name(f);
    if (name.size() != s.size()) continue;
    bool same = true;
    for (std::size_t i = 0; i < s.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(name[i]))) {
        same = false;
        break;
      }
    }
    if (same) return f;
  }
  return std::nullopt;
}

inline FuelSet all_fuel_types() noexcept {
  FuelSet s;
  s.set();
  return s;
}

inline FuelSet fuel_set_of(std::initializer_list<FuelType> fuels) noexcept {
  FuelSet s;
  for (FuelType f : fuels) s.set(fuel_index(f));
  return s;
}

// "LNG; Methanol" in enum order. Empty set -> "".
inline std::string fuel_set_to_string(const FuelSet& s) {
  std::string out;
  for (FuelType f : kAllFuelTypes) {
    if (!s.test(fuel_index(f))) continue;
    if (!out.empty()) out += "; ";
    out += fuel_type_name(f);
  }
  return out;
}

}  // namespace fleetopt
