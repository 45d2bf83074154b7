#include "engine/core/run_fingerprint.hpp"

#include <algorithm>

namespace fleetopt {

Hash64 hash_vessel_table(const VesselTable& table) {
  Fnv1a64 h;
  h.update_tag("VesselTable/v1");
  h.update_u64(static_cast<uint64_t>(table.size()));

  for (const auto& v : table.vessels()) {
    h.update_i64(v.id);
    h.update_f64(v.dwt);
    h.update_enum(v.main_fuel_type);
    h.update_f64(v.safety_score);
    h.update_f64(v.adjusted_cost);
    h.update_f64(v.co2_eq);
    h.update_f64(v.fuel_total);
    h.update_u8(0x1E); // per-row separator
  }
  return h.digest();
}

Hash64 hash_scenario(const Scenario& s) {
  Fnv1a64 h;
  h.update_tag("Scenario/v1");
  h.update_string(s.label);
  h.update_f64(s.safety_floor);
  h.update_f64(s.cargo_requirement_dwt);
  h.update_fuel_set(s.required_fuel_types);
  h.update_f64(s.carbon_price_usd_per_t);
  return h.digest();
}

Hash64 hash_fleet_ids(std::vector<VesselId> ids) {
  std::sort(ids.begin(), ids.end());

  Fnv1a64 h;
  h.update_tag("Fleet/v1");
  h.update_u64(static_cast<uint64_t>(ids.size()));
  for (VesselId id : ids) h.update_i64(id);
  return h.digest();
}

std::string run_input_fingerprint_hex(const VesselTable& table, const Scenario& scenario) {
  return hash_to_hex(hash_combine(hash_vessel_table(table), hash_scenario(scenario)));
}

}  // namespace fleetopt
