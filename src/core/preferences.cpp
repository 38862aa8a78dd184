#include "cosmos/core/preferences.h"

namespace cosmos {
namespace {

const std::vector<Id>& prefer(const std::vector<Id>& primary, const std::vector<Id>& fallback) {
  return primary.empty() ? fallback : primary;
}

std::vector<Id> ids_at(const json::Value& v, const char* snake, const char* camel) {
  std::vector<Id> out;
  const json::Value* a = v.find(snake);
  if (!a) a = v.find(camel);
  if (!a || !a->is_array()) return out;
  for (const auto& e : a->array()) {
    if (e.is_number()) out.push_back(static_cast<Id>(e.int_value()));
  }
  return out;
}

} // namespace

SavePreferences merge_preferences(const std::optional<StoredPreferences>& from_profile,
                                  const std::optional<StoredPreferences>& from_table) {
  static const StoredPreferences kEmpty;
  const StoredPreferences& profile = from_profile ? *from_profile : kEmpty;
  const StoredPreferences& table = from_table ? *from_table : kEmpty;

  SavePreferences out;
  out.watchlist_company_ids = prefer(table.watchlist_company_ids, profile.watchlist_company_ids);
  out.removed_company_ids = prefer(table.removed_company_ids, profile.removed_company_ids);
  out.view_mode = table.view_mode.value_or(profile.view_mode.value_or(ViewMode::Explore));
  return out;
}

StoredPreferences stored_preferences_from_json(const json::Value& v) {
  StoredPreferences p;
  if (!v.is_object()) return p;
  p.watchlist_company_ids = ids_at(v, "watchlist_company_ids", "watchlistCompanyIds");
  p.removed_company_ids = ids_at(v, "removed_company_ids", "removedCompanyIds");

  const json::Value* vm = v.find("view_mode");
  if (!vm) vm = v.find("viewMode");
  ViewMode parsed = ViewMode::Explore;
  if (vm && parse_view_mode(vm->string_value(), parsed)) p.view_mode = parsed;
  return p;
}

void apply_preferences(ExplorationState& state, const SavePreferences& prefs) {
  state.watchlist_company_ids.clear();
  for (Id id : prefs.watchlist_company_ids) {
    if (!contains_id(state.watchlist_company_ids, id)) state.watchlist_company_ids.push_back(id);
  }
  state.removed_company_ids = prefs.removed_company_ids;
  state.view_mode = prefs.view_mode;
}

} // namespace cosmos
