#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cosmos/core/entities.h"

namespace cosmos {

// A single user's exploration state.
struct ExplorationState {
  // Identity token issued by the external identity provider (a UUID).
  std::string id;
  std::string name;
  UserProfile profile;

  // Externally supplied initial set.
  std::vector<Company> base_companies;
  // Grown by add_company().
  std::vector<Company> added_companies;

  // Tombstones. Removal never erases the record itself.
  std::vector<Id> removed_company_ids;
  // Ordered, no duplicates.
  std::vector<Id> watchlist_company_ids;

  ViewMode view_mode{ViewMode::Explore};
  std::optional<Id> last_selected_company_id;

  // Next id handed out by allocate_company_id(). Persisted so that purging
  // tombstoned records can never cause an id to be reused.
  Id next_company_id{1};
};

// Returns max(every known id, floor, next_company_id - 1) + 1 and advances
// next_company_id past it.
Id allocate_company_id(ExplorationState& s, Id floor);

// Largest id across base and added companies (kInvalidId when empty).
Id max_company_id(const ExplorationState& s);

// Searches base then added. nullptr when absent.
Company* find_company(ExplorationState& s, Id id);
const Company* find_company(const ExplorationState& s, Id id);

bool contains_id(const std::vector<Id>& ids, Id id);

} // namespace cosmos
