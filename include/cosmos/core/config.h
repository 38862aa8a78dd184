#pragma once

#include <string>

#include "cosmos/core/positioning.h"
#include "cosmos/util/json.h"

namespace cosmos {

struct ManagerConfig {
  // Ids handed to added companies start above this, so they never collide
  // with ids allocated by the upstream company catalog.
  Id min_added_company_id{1000};

  // Local cache key. The whole state is stored as one JSON document under it.
  std::string cache_key{"cosmos-exploration-state"};

  PositioningConfig positioning;

  // On construction, place visible companies that have no placement in the
  // view they are shown in. Done in id order, without persisting.
  bool place_missing_on_load{true};
};

// Reads a JSON object of the form
//   {"min_added_company_id": 1000, "cache_key": "...",
//    "place_missing_on_load": true, "positioning": {"min_radius": 60, ...}}
//
// Unknown keys are ignored; keys with the wrong type keep their defaults.
// Throws std::runtime_error if the document is not a JSON object.
ManagerConfig manager_config_from_json(const json::Value& v);
ManagerConfig load_manager_config_from_json(const std::string& json_text);

json::Value manager_config_to_json(const ManagerConfig& cfg);

} // namespace cosmos
