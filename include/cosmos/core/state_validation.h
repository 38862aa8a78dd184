#pragma once

#include <string>
#include <vector>

#include "cosmos/core/exploration_state.h"

namespace cosmos {

// Check referential integrity and basic invariants of an ExplorationState.
//
// Intended for snapshots that did not come from the manager itself (hand
// edits, imports, older clients).
//
// Returns a sorted list of human-readable error strings.
// Empty => state is considered valid.
std::vector<std::string> validate_exploration_state(const ExplorationState& s);

struct FixReport {
  int changes{0};
  std::vector<std::string> actions;
};

// Repair what validate_exploration_state() reports, in place.
//
// Prefers pruning dangling references over inventing records: duplicate
// company records are dropped (first occurrence wins), unknown or duplicate
// ids are removed from the tombstone and watchlist lists, scores and
// placements are clamped, and the id high-water mark is raised. A malformed
// identity token cannot be repaired and is left as is.
FixReport fix_exploration_state(ExplorationState& s);

} // namespace cosmos
