#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cosmos/core/config.h"
#include "cosmos/core/entities.h"
#include "cosmos/core/exploration_state.h"
#include "cosmos/core/persistence.h"
#include "cosmos/core/task_queue.h"

namespace cosmos {

// Owns one user's exploration state and keeps it persisted.
//
// Every mutation updates the in-memory model, writes a full snapshot to the
// local cache synchronously (failures are logged, never thrown) and defers a
// single remote write onto the scheduler. Mutations made before that write
// runs are coalesced into it; it always sends the state as of run time.
//
// The deferred write checks the identity token first and throws
// std::invalid_argument out of the scheduler if it is not a UUID.
class ExplorationStateManager {
 public:
  // `cache` may be null (no local persistence). The scheduler must outlive
  // the manager or be drained before it is destroyed.
  ExplorationStateManager(ExplorationState initial, std::shared_ptr<KeyValueCache> cache, PersistencePolicy policy,
                          TaskScheduler& scheduler, ManagerConfig cfg = {});
  ~ExplorationStateManager();

  ExplorationStateManager(const ExplorationStateManager&) = delete;
  ExplorationStateManager& operator=(const ExplorationStateManager&) = delete;

  // --- Mutations ---

  // Assigns a fresh id (above every id ever handed out and above
  // cfg.min_added_company_id) and appends to the added companies. A supplied
  // explore placement is kept only if it is free; otherwise one is computed.
  Company add_company(Company company);

  // Replaces the record with the same id. An unknown id is added as a new
  // company instead (logged as a warning).
  Company update_company(const Company& company);

  // Like update_company() but throws std::out_of_range for an unknown id.
  Company replace_company(const Company& company);

  // Tombstones the company, drops it from the watchlist and clears the
  // selection if it was selected. Idempotent.
  void remove_company(Id id);

  // Lifts the tombstone. The company reappears in explore, never on the
  // watchlist; it is re-placed if its explore placement is missing or now
  // collides. Idempotent.
  void restore_company(Id id);

  // Moves the company between the views and returns whether it is now on the
  // watchlist. Its placement in the destination view is recomputed; the
  // placement in the other view is kept. Unknown or removed ids are ignored
  // (returns false).
  bool toggle_watchlist(Id id);

  // Written to the local cache only.
  void set_selected_company(std::optional<Id> id);

  void set_view_mode(ViewMode mode);

  // Erases tombstoned added companies together with their tombstones.
  // Tombstones of base companies are kept. Returns the number erased.
  std::size_t purge_removed_companies();

  // Runs the pending remote write now (e.g. at shutdown). No-op when nothing
  // is pending.
  void flush_pending_writes();

  // --- Queries (all return copies) ---

  // Base and added companies that are not removed.
  std::vector<Company> get_all_companies() const;
  // The companies visible in the current view mode.
  std::vector<Company> get_displayed_companies() const;
  std::vector<Company> get_watchlist_companies() const;
  WatchlistStats get_watchlist_stats() const;
  ExplorationStats get_exploration_stats() const;
  std::optional<Company> get_selected_company() const;
  bool is_in_watchlist(Id id) const;
  bool is_company_removed(Id id) const;
  ViewMode get_view_mode() const { return state_.view_mode; }
  UserProfile get_user_profile() const { return state_.profile; }
  ExplorationState get_current_state() const { return state_; }

  bool has_pending_remote_write() const { return remote_write_pending_; }
  const CascadeResult& last_persist_result() const { return last_persist_result_; }
  int remote_writes() const { return remote_writes_; }
  const ManagerConfig& config() const { return cfg_; }

  // Throws std::invalid_argument unless `user_id` is a canonical UUID.
  static void validate_user_id(const std::string& user_id);

 private:
  bool visible_in(const Company& c, ViewMode view) const;
  std::vector<Company> occupants(ViewMode view, Id exclude) const;

  // Places `company` in `view` and applies any relocation the engine chose.
  PositioningSolution place(const Company& company, ViewMode view);
  void apply_solution(const PositioningSolution& sol);
  void place_missing();

  void persist();
  void write_local_cache();
  void schedule_remote_write();
  void run_remote_write();

  ExplorationState state_;
  std::shared_ptr<KeyValueCache> cache_;
  PersistencePolicy policy_;
  TaskScheduler& scheduler_;
  ManagerConfig cfg_;

  bool remote_write_pending_{false};
  int remote_writes_{0};
  CascadeResult last_persist_result_;

  // Deferred tasks hold a weak reference and skip the write once the manager
  // is gone.
  std::shared_ptr<bool> alive_;
};

} // namespace cosmos
