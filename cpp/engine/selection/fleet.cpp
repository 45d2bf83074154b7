#include "engine/selection/fleet.hpp"

#include <algorithm>
#include <utility>

#include "engine/core/errors.hpp"

namespace fleetopt {

Fleet Fleet::from_ids(const VesselTable& table, std::vector<VesselId> ids) {
  std::sort(ids.begin(), ids.end());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0 && ids[i] == ids[i - 1]) {
      throw MalformedInputError("Fleet: vessel id " + std::to_string(ids[i]) + " listed twice");
    }
    if (!table.find(ids[i])) {
      throw MalformedInputError("Fleet: vessel id " + std::to_string(ids[i]) + " not in vessel table");
    }
  }
  return Fleet(std::move(ids));
}

Fleet Fleet::from_indices(const VesselTable& table, const std::vector<std::size_t>& indices) {
  std::vector<VesselId> ids;
  ids.reserve(indices.size());
  for (std::size_t idx : indices) {
    if (idx >= table.size()) {
      throw MalformedInputError("Fleet: vessel index " + std::to_string(idx) + " out of range");
    }
    ids.push_back(table.at(idx).id);
  }
  return from_ids(table, std::move(ids));
}

bool Fleet::contains(VesselId id) const noexcept {
  return std::binary_search(ids_.begin(), ids_.end(), id);
}

}  // namespace fleetopt
