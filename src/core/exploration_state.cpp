#include "cosmos/core/exploration_state.h"

#include <algorithm>

#include "cosmos/util/strings.h"

namespace cosmos {

const char* view_mode_to_string(ViewMode v) {
  switch (v) {
    case ViewMode::Explore: return "explore";
    case ViewMode::Watchlist: return "watchlist";
  }
  return "explore";
}

bool parse_view_mode(const std::string& raw, ViewMode& out) {
  const std::string s = to_lower(trim_copy(raw));
  if (s == "explore") {
    out = ViewMode::Explore;
    return true;
  }
  if (s == "watchlist") {
    out = ViewMode::Watchlist;
    return true;
  }
  return false;
}

Id max_company_id(const ExplorationState& s) {
  Id max_id = kInvalidId;
  for (const auto& c : s.base_companies) max_id = std::max(max_id, c.id);
  for (const auto& c : s.added_companies) max_id = std::max(max_id, c.id);
  return max_id;
}

Id allocate_company_id(ExplorationState& s, Id floor) {
  const Id highest = std::max({max_company_id(s), floor, s.next_company_id - 1});
  const Id id = highest + 1;
  s.next_company_id = id + 1;
  return id;
}

Company* find_company(ExplorationState& s, Id id) {
  for (auto& c : s.base_companies) {
    if (c.id == id) return &c;
  }
  for (auto& c : s.added_companies) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

const Company* find_company(const ExplorationState& s, Id id) {
  for (const auto& c : s.base_companies) {
    if (c.id == id) return &c;
  }
  for (const auto& c : s.added_companies) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

bool contains_id(const std::vector<Id>& ids, Id id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace cosmos
