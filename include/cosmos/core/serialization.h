#pragma once

#include <string>
#include <vector>

#include "cosmos/core/exploration_state.h"
#include "cosmos/util/json.h"

namespace cosmos {

// Preference block sent alongside the companies on every remote save.
struct SavePreferences {
  std::vector<Id> watchlist_company_ids;
  std::vector<Id> removed_company_ids;
  ViewMode view_mode{ViewMode::Explore};
};

// Everything a remote store receives for one save.
struct SavePayload {
  std::string user_id;
  UserProfile profile;
  // base + added, tombstoned records included.
  std::vector<Company> companies;
  SavePreferences preferences;
};

SavePayload make_save_payload(const ExplorationState& state);

json::Value company_to_json(const Company& c);
Company company_from_json(const json::Value& v);

json::Value profile_to_json(const UserProfile& p);
UserProfile profile_from_json(const json::Value& v);

json::Value preferences_to_json(const SavePreferences& p);

// Serialize the full exploration state (the local cache snapshot format).
json::Value serialize_state_to_json_value(const ExplorationState& state);
std::string serialize_state_to_json(const ExplorationState& state, int indent = 2);

// Parse a snapshot. Throws std::runtime_error on malformed JSON or missing
// required keys. Older snapshots written with camelCase keys are accepted.
ExplorationState deserialize_state_from_json(const std::string& json_text);
ExplorationState deserialize_state_from_json_value(const json::Value& root);

std::string serialize_save_payload_to_json(const SavePayload& payload, int indent = 2);

} // namespace cosmos
