#include "cosmos/core/state_validation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "cosmos/core/positioning.h"
#include "cosmos/util/strings.h"

namespace cosmos {
namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

bool placement_valid(const Placement& p) {
  return std::isfinite(p.angle) && std::isfinite(p.distance) && p.angle >= 0.0 && p.angle < 360.0 &&
         p.distance >= 0.0;
}

void check_company(std::vector<std::string>& errors, const char* list, std::size_t i, const Company& c) {
  if (c.id <= kInvalidId) push(errors, join(list, "[", i, "] has invalid id ", c.id));
  if (!std::isfinite(c.match_score) || c.match_score < 0.0 || c.match_score > 100.0) {
    push(errors, join("company ", c.id, " match_score out of range: ", c.match_score));
  }
  if (c.explore_position && !placement_valid(*c.explore_position)) {
    push(errors, join("company ", c.id, " has invalid explore_position"));
  }
  if (c.watchlist_position && !placement_valid(*c.watchlist_position)) {
    push(errors, join("company ", c.id, " has invalid watchlist_position"));
  }
  if (c.open_roles < 0) push(errors, join("company ", c.id, " has negative open_roles"));
}

// Returns true if the placement was changed (clamped or dropped).
bool repair_placement(std::optional<Placement>& p) {
  if (!p) return false;
  if (!std::isfinite(p->angle) || !std::isfinite(p->distance)) {
    p.reset();
    return true;
  }
  const Placement fixed{normalize_angle(p->angle), std::max(0.0, p->distance)};
  if (fixed == *p) return false;
  *p = fixed;
  return true;
}

// Removes ids that are unknown, duplicated or rejected by `drop`.
template <typename Pred>
int prune_ids(std::vector<Id>& ids, const std::unordered_set<Id>& known, Pred drop, FixReport& report,
              const char* list) {
  std::unordered_set<Id> seen;
  std::vector<Id> kept;
  kept.reserve(ids.size());
  int removed = 0;
  for (Id id : ids) {
    if (!known.count(id)) {
      report.actions.push_back(join("Removed unknown company id ", id, " from ", list));
      ++removed;
    } else if (!seen.insert(id).second) {
      report.actions.push_back(join("Removed duplicate company id ", id, " from ", list));
      ++removed;
    } else if (drop(id)) {
      report.actions.push_back(join("Removed tombstoned company id ", id, " from ", list));
      ++removed;
    } else {
      kept.push_back(id);
    }
  }
  ids = std::move(kept);
  return removed;
}

} // namespace

std::vector<std::string> validate_exploration_state(const ExplorationState& s) {
  std::vector<std::string> errors;

  if (!is_uuid(s.id)) push(errors, join("identity token is not a UUID: '", s.id, "'"));

  std::unordered_set<Id> known;
  for (std::size_t i = 0; i < s.base_companies.size(); ++i) {
    const auto& c = s.base_companies[i];
    check_company(errors, "base_companies", i, c);
    if (!known.insert(c.id).second) push(errors, join("duplicate company id ", c.id, " in base_companies"));
  }
  for (std::size_t i = 0; i < s.added_companies.size(); ++i) {
    const auto& c = s.added_companies[i];
    check_company(errors, "added_companies", i, c);
    if (!known.insert(c.id).second) push(errors, join("duplicate company id ", c.id, " in added_companies"));
  }

  std::unordered_set<Id> removed;
  for (Id id : s.removed_company_ids) {
    if (!known.count(id)) push(errors, join("removed_company_ids references unknown company ", id));
    if (!removed.insert(id).second) push(errors, join("removed_company_ids lists ", id, " more than once"));
  }

  std::unordered_set<Id> watched;
  for (Id id : s.watchlist_company_ids) {
    if (!known.count(id)) push(errors, join("watchlist_company_ids references unknown company ", id));
    if (!watched.insert(id).second) push(errors, join("watchlist_company_ids lists ", id, " more than once"));
    if (removed.count(id)) push(errors, join("company ", id, " is both removed and watchlisted"));
  }

  if (s.last_selected_company_id) {
    const Id sel = *s.last_selected_company_id;
    if (!known.count(sel)) {
      push(errors, join("last_selected_company_id references unknown company ", sel));
    } else if (removed.count(sel)) {
      push(errors, join("last_selected_company_id references removed company ", sel));
    }
  }

  const Id max_id = max_company_id(s);
  if (max_id != kInvalidId && s.next_company_id <= max_id) {
    push(errors, join("next_company_id is not monotonic: next_company_id=", s.next_company_id,
                      " max_existing_id=", max_id));
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

FixReport fix_exploration_state(ExplorationState& s) {
  FixReport report;

  // Duplicate records: first occurrence (base before added) wins.
  std::unordered_set<Id> known;
  const auto dedupe = [&](std::vector<Company>& list, const char* name) {
    std::vector<Company> kept;
    kept.reserve(list.size());
    for (auto& c : list) {
      if (c.id <= kInvalidId || !known.insert(c.id).second) {
        report.actions.push_back(join("Dropped company record with id ", c.id, " from ", name));
        ++report.changes;
        continue;
      }
      kept.push_back(std::move(c));
    }
    list = std::move(kept);
  };
  dedupe(s.base_companies, "base_companies");
  dedupe(s.added_companies, "added_companies");

  const auto repair_company = [&](Company& c) {
    double score = std::isfinite(c.match_score) ? std::clamp(c.match_score, 0.0, 100.0) : 0.0;
    if (score != c.match_score) {
      report.actions.push_back(join("Clamped match_score of company ", c.id, " to ", score));
      c.match_score = score;
      ++report.changes;
    }
    if (repair_placement(c.explore_position)) {
      report.actions.push_back(join("Repaired explore_position of company ", c.id));
      ++report.changes;
    }
    if (repair_placement(c.watchlist_position)) {
      report.actions.push_back(join("Repaired watchlist_position of company ", c.id));
      ++report.changes;
    }
    if (c.open_roles < 0) {
      report.actions.push_back(join("Reset negative open_roles of company ", c.id));
      c.open_roles = 0;
      ++report.changes;
    }
  };
  for (auto& c : s.base_companies) repair_company(c);
  for (auto& c : s.added_companies) repair_company(c);

  report.changes += prune_ids(s.removed_company_ids, known, [](Id) { return false; }, report, "removed_company_ids");

  const std::unordered_set<Id> removed(s.removed_company_ids.begin(), s.removed_company_ids.end());
  report.changes += prune_ids(s.watchlist_company_ids, known, [&](Id id) { return removed.count(id) > 0; }, report,
                              "watchlist_company_ids");

  if (s.last_selected_company_id) {
    const Id sel = *s.last_selected_company_id;
    if (!known.count(sel) || removed.count(sel)) {
      report.actions.push_back(join("Cleared dangling selection ", sel));
      s.last_selected_company_id.reset();
      ++report.changes;
    }
  }

  const Id max_id = max_company_id(s);
  if (s.next_company_id <= max_id) {
    report.actions.push_back(join("Raised next_company_id from ", s.next_company_id, " to ", max_id + 1));
    s.next_company_id = max_id + 1;
    ++report.changes;
  }
  return report;
}

} // namespace cosmos
