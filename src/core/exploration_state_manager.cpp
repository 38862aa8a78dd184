#include "cosmos/core/exploration_state_manager.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>

#include "cosmos/core/positioning.h"
#include "cosmos/util/log.h"
#include "cosmos/util/strings.h"

namespace cosmos {
namespace {

std::string label(const Company* c, Id id) {
  return (c ? c->name : std::string("Unknown")) + " (ID: " + std::to_string(id) + ")";
}

void erase_id(std::vector<Id>& ids, Id id) { ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end()); }

} // namespace

ExplorationStateManager::ExplorationStateManager(ExplorationState initial, std::shared_ptr<KeyValueCache> cache,
                                                 PersistencePolicy policy, TaskScheduler& scheduler,
                                                 ManagerConfig cfg)
    : state_(std::move(initial)),
      cache_(std::move(cache)),
      policy_(std::move(policy)),
      scheduler_(scheduler),
      cfg_(std::move(cfg)),
      alive_(std::make_shared<bool>(true)) {
  state_.next_company_id = std::max(state_.next_company_id, max_company_id(state_) + 1);

  // A removed company is never watchlisted.
  auto& watch = state_.watchlist_company_ids;
  const auto before = watch.size();
  watch.erase(std::remove_if(watch.begin(), watch.end(), [&](Id id) { return is_company_removed(id); }), watch.end());
  if (watch.size() != before) {
    log::warn("exploration: dropped " + std::to_string(before - watch.size()) +
              " removed companies from the loaded watchlist");
  }

  if (cfg_.place_missing_on_load) place_missing();

  log::info("exploration: loaded " + std::to_string(state_.base_companies.size()) + " base and " +
            std::to_string(state_.added_companies.size()) + " added companies for '" + state_.name + "'");
}

ExplorationStateManager::~ExplorationStateManager() {
  if (remote_write_pending_) log::warn("exploration: discarding a pending remote write");
}

// --- Mutations ---

Company ExplorationStateManager::add_company(Company company) {
  company.id = allocate_company_id(state_, cfg_.min_added_company_id);
  state_.added_companies.push_back(company);
  const auto& supplied = company.explore_position;
  if (!supplied ||
      conflicts_with_any(*supplied, occupants(ViewMode::Explore, company.id), ViewMode::Explore, cfg_.positioning,
                         company.id)) {
    place(company, ViewMode::Explore);
  }

  const Company stored = state_.added_companies.back();
  persist();
  log::info("exploration: added company " + label(&stored, stored.id));
  return stored;
}

Company ExplorationStateManager::update_company(const Company& company) {
  Company* existing = find_company(state_, company.id);
  if (!existing) {
    log::warn("exploration: company " + label(&company, company.id) + " not found for update, adding as new");
    return add_company(company);
  }

  *existing = company;
  const Company stored = *existing;
  persist();
  log::info("exploration: updated company " + label(&stored, stored.id));
  return stored;
}

Company ExplorationStateManager::replace_company(const Company& company) {
  if (!find_company(state_, company.id)) {
    throw std::out_of_range("replace_company: unknown company id " + std::to_string(company.id));
  }
  return update_company(company);
}

void ExplorationStateManager::remove_company(Id id) {
  const Company* c = find_company(state_, id);
  if (!c) {
    log::warn("exploration: remove_company ignored unknown id " + std::to_string(id));
    return;
  }

  if (!contains_id(state_.removed_company_ids, id)) state_.removed_company_ids.push_back(id);
  erase_id(state_.watchlist_company_ids, id);
  if (state_.last_selected_company_id == id) state_.last_selected_company_id.reset();

  persist();
  log::info("exploration: removed company " + label(c, id));
}

void ExplorationStateManager::restore_company(Id id) {
  if (!contains_id(state_.removed_company_ids, id)) return;
  erase_id(state_.removed_company_ids, id);
  erase_id(state_.watchlist_company_ids, id);

  const Company* c = find_company(state_, id);
  if (c && visible_in(*c, ViewMode::Explore)) {
    const auto& p = c->explore_position;
    if (!p || conflicts_with_any(*p, occupants(ViewMode::Explore, id), ViewMode::Explore, cfg_.positioning, id)) {
      place(*c, ViewMode::Explore);
    }
  }

  persist();
  log::info("exploration: restored company " + label(find_company(state_, id), id));
}

bool ExplorationStateManager::toggle_watchlist(Id id) {
  const Company* c = find_company(state_, id);
  if (!c || is_company_removed(id)) {
    log::warn("exploration: toggle_watchlist ignored " + std::string(c ? "removed" : "unknown") + " id " +
              std::to_string(id));
    return false;
  }

  const bool added = !contains_id(state_.watchlist_company_ids, id);
  if (added) {
    state_.watchlist_company_ids.push_back(id);
  } else {
    erase_id(state_.watchlist_company_ids, id);
  }

  const ViewMode dest = added ? ViewMode::Watchlist : ViewMode::Explore;
  place(*c, dest);

  persist();
  log::info(std::string("exploration: ") + (added ? "added to" : "removed from") + " watchlist: " + label(c, id));
  return added;
}

void ExplorationStateManager::set_selected_company(std::optional<Id> id) {
  state_.last_selected_company_id = id;
  write_local_cache();
}

void ExplorationStateManager::set_view_mode(ViewMode mode) {
  state_.view_mode = mode;
  persist();
  log::info(std::string("exploration: view mode changed to ") + view_mode_to_string(mode));
}

std::size_t ExplorationStateManager::purge_removed_companies() {
  // Keep the high-water mark above every id that is about to disappear.
  state_.next_company_id = std::max(state_.next_company_id, max_company_id(state_) + 1);

  std::vector<Id> purged;
  auto& added = state_.added_companies;
  added.erase(std::remove_if(added.begin(), added.end(),
                             [&](const Company& c) {
                               if (!contains_id(state_.removed_company_ids, c.id)) return false;
                               purged.push_back(c.id);
                               return true;
                             }),
              added.end());
  if (purged.empty()) return 0;

  for (Id id : purged) erase_id(state_.removed_company_ids, id);
  persist();
  log::info("exploration: purged " + std::to_string(purged.size()) + " removed companies");
  return purged.size();
}

void ExplorationStateManager::flush_pending_writes() { run_remote_write(); }

// --- Queries ---

std::vector<Company> ExplorationStateManager::get_all_companies() const {
  std::vector<Company> out;
  out.reserve(state_.base_companies.size() + state_.added_companies.size());
  for (const auto* list : {&state_.base_companies, &state_.added_companies}) {
    for (const auto& c : *list) {
      if (!is_company_removed(c.id)) out.push_back(c);
    }
  }
  return out;
}

std::vector<Company> ExplorationStateManager::get_displayed_companies() const {
  std::vector<Company> out;
  for (auto& c : get_all_companies()) {
    if (visible_in(c, state_.view_mode)) out.push_back(std::move(c));
  }
  return out;
}

std::vector<Company> ExplorationStateManager::get_watchlist_companies() const {
  std::vector<Company> out;
  for (auto& c : get_all_companies()) {
    if (is_in_watchlist(c.id)) out.push_back(std::move(c));
  }
  return out;
}

WatchlistStats ExplorationStateManager::get_watchlist_stats() const {
  WatchlistStats s;
  for (const auto& c : get_watchlist_companies()) {
    ++s.total_companies;
    if (c.match_score >= kExcellentMatchScore) ++s.excellent_matches;
    s.total_open_roles += c.open_roles;
  }
  return s;
}

ExplorationStats ExplorationStateManager::get_exploration_stats() const {
  ExplorationStats s;
  s.total = static_cast<int>(get_all_companies().size());
  s.base = static_cast<int>(state_.base_companies.size());
  s.added = static_cast<int>(state_.added_companies.size());
  s.removed = static_cast<int>(state_.removed_company_ids.size());
  s.watchlisted = static_cast<int>(state_.watchlist_company_ids.size());
  s.view_mode = state_.view_mode;
  return s;
}

std::optional<Company> ExplorationStateManager::get_selected_company() const {
  if (!state_.last_selected_company_id) return std::nullopt;
  const Id id = *state_.last_selected_company_id;
  const Company* c = find_company(state_, id);
  if (!c || is_company_removed(id)) return std::nullopt;
  return *c;
}

bool ExplorationStateManager::is_in_watchlist(Id id) const { return contains_id(state_.watchlist_company_ids, id); }

bool ExplorationStateManager::is_company_removed(Id id) const { return contains_id(state_.removed_company_ids, id); }

void ExplorationStateManager::validate_user_id(const std::string& user_id) {
  if (is_uuid(user_id)) return;
  throw std::invalid_argument("Invalid userId: '" + user_id +
                              "'. Expected a UUID (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx); the identity token "
                              "must come from the identity provider, not a profile id.");
}

// --- Placement ---

bool ExplorationStateManager::visible_in(const Company& c, ViewMode view) const {
  if (is_company_removed(c.id)) return false;
  return is_in_watchlist(c.id) == (view == ViewMode::Watchlist);
}

std::vector<Company> ExplorationStateManager::occupants(ViewMode view, Id exclude) const {
  std::vector<Company> out;
  for (const auto* list : {&state_.base_companies, &state_.added_companies}) {
    for (const auto& c : *list) {
      if (c.id != exclude && visible_in(c, view)) out.push_back(c);
    }
  }
  return out;
}

PositioningSolution ExplorationStateManager::place(const Company& company, ViewMode view) {
  // Copy first: applying the solution writes through to the stored record.
  const Company subject = company;
  PositioningSolution sol = resolve_placement(subject, occupants(view, subject.id), view, cfg_.positioning);
  apply_solution(sol);
  log::debug(std::string("exploration: placed #") + std::to_string(subject.id) + " in " + view_mode_to_string(view) +
             " via " + placement_stage_to_string(sol.stage) + " (" + sol.reason + ")");
  return sol;
}

void ExplorationStateManager::apply_solution(const PositioningSolution& sol) {
  for (const auto& r : sol.relocated) {
    Company* target = find_company(state_, r.company.id);
    if (!target) continue;
    placement_in(*target, sol.view) = placement_in(r.company, sol.view);
  }
}

void ExplorationStateManager::place_missing() {
  std::vector<std::pair<Id, ViewMode>> todo;
  for (const auto* list : {&state_.base_companies, &state_.added_companies}) {
    for (const auto& c : *list) {
      if (is_company_removed(c.id)) continue;
      const ViewMode view = is_in_watchlist(c.id) ? ViewMode::Watchlist : ViewMode::Explore;
      if (!placement_in(c, view)) todo.emplace_back(c.id, view);
    }
  }
  std::sort(todo.begin(), todo.end());

  for (const auto& [id, view] : todo) {
    if (const Company* c = find_company(state_, id)) place(*c, view);
  }
  if (!todo.empty()) log::info("exploration: placed " + std::to_string(todo.size()) + " companies without a position");
}

// --- Persistence ---

void ExplorationStateManager::persist() {
  write_local_cache();
  schedule_remote_write();
}

void ExplorationStateManager::write_local_cache() {
  if (!cache_) return;
  const CacheWriteResult r = write_state_to_cache(*cache_, cfg_.cache_key, state_);
  if (!r.ok) log::warn("exploration: local cache write failed: " + r.error);
}

void ExplorationStateManager::schedule_remote_write() {
  if (remote_write_pending_) return;
  remote_write_pending_ = true;

  std::weak_ptr<bool> alive = alive_;
  scheduler_.defer([this, alive]() {
    if (alive.expired()) return;
    run_remote_write();
  });
}

void ExplorationStateManager::run_remote_write() {
  if (!remote_write_pending_) return;
  remote_write_pending_ = false;

  validate_user_id(state_.id);

  ++remote_writes_;
  last_persist_result_ = policy_.persist(state_);
  if (!last_persist_result_.saved && last_persist_result_.failures.empty()) {
    log::debug("exploration: no persistence backend enabled for " +
               std::string(runtime_environment_to_string(policy_.environment())));
  }
}

} // namespace cosmos
