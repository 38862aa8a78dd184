#pragma once

#include <optional>
#include <vector>

#include "cosmos/core/entities.h"
#include "cosmos/core/serialization.h"

namespace cosmos {

// Preferences as read from one storage location. Empty lists and an unset
// view mode mean "nothing stored there".
struct StoredPreferences {
  std::vector<Id> watchlist_company_ids;
  std::vector<Id> removed_company_ids;
  std::optional<ViewMode> view_mode;
};

// The preferences table is authoritative; the copy embedded in the profile
// is only consulted for lists the table leaves empty.
SavePreferences merge_preferences(const std::optional<StoredPreferences>& from_profile,
                                  const std::optional<StoredPreferences>& from_table);

// Accepts both snake_case and camelCase keys. Unknown view modes are ignored.
StoredPreferences stored_preferences_from_json(const json::Value& v);

// Overwrites the state's watchlist, tombstones and view mode.
void apply_preferences(ExplorationState& state, const SavePreferences& prefs);

} // namespace cosmos
