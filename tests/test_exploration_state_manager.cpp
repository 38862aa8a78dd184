#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cosmos/core/exploration_state_manager.h"
#include "cosmos/core/positioning.h"
#include "cosmos/core/serialization.h"
#include "cosmos/util/file_io.h"

#define COSMOS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace cosmos;

constexpr const char* kUserId = "9d49907c-a057-4f3b-9cfc-a6e2769b44cd";

class RecordingRemote : public RemoteStore {
 public:
  SaveResult save(const std::string& user_id, const UserProfile& profile, const std::vector<Company>& companies,
                  const SavePreferences& preferences) override {
    ++calls;
    last.user_id = user_id;
    last.profile = profile;
    last.companies = companies;
    last.preferences = preferences;
    SaveResult r;
    r.ok = !reject;
    if (reject) r.error = "service unavailable";
    return r;
  }

  int calls{0};
  bool reject{false};
  SavePayload last;
};

class FailingCache : public KeyValueCache {
 public:
  std::optional<std::string> get(const std::string&) override { return std::nullopt; }
  void set(const std::string&, const std::string&) override {
    ++attempts;
    throw std::runtime_error("quota exceeded");
  }
  void remove(const std::string&) override {}

  int attempts{0};
};

ExplorationState empty_state() {
  ExplorationState s;
  s.id = kUserId;
  s.name = "Test User";
  s.profile.name = "Test User";
  s.profile.target_role = "Staff Engineer";
  return s;
}

Company company(const std::string& name, double score, int open_roles = 0) {
  Company c;
  c.name = name;
  c.match_score = score;
  c.open_roles = open_roles;
  return c;
}

PersistencePolicy remote_only(const std::shared_ptr<RecordingRemote>& remote) {
  PersistencePolicy p(RuntimeEnvironment::Test);
  p.add(std::make_shared<RemoteStoreBackend>(remote));
  return p;
}

bool contains(const std::vector<Company>& list, Id id) {
  return std::any_of(list.begin(), list.end(), [&](const Company& c) { return c.id == id; });
}

bool view_conflicts(const std::vector<Company>& list, ViewMode view) {
  for (std::size_t i = 0; i < list.size(); ++i) {
    for (std::size_t j = i + 1; j < list.size(); ++j) {
      const auto& a = placement_in(list[i], view);
      const auto& b = placement_in(list[j], view);
      if (a && b && placements_conflict(*a, *b)) return true;
    }
  }
  return false;
}

} // namespace

int test_exploration_state_manager() {
  using namespace cosmos;

  // Add then watchlist on an empty state.
  {
    auto remote = std::make_shared<RecordingRemote>();
    auto cache = std::make_shared<MemoryKeyValueCache>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), cache, remote_only(remote), queue);

    const Company acme = mgr.add_company(company("Acme", 90.0, 4));
    COSMOS_ASSERT(acme.id == 1001);
    COSMOS_ASSERT(acme.explore_position.has_value());
    COSMOS_ASSERT(acme.explore_position->distance == score_to_distance(90.0));
    COSMOS_ASSERT(!acme.watchlist_position.has_value());

    COSMOS_ASSERT(mgr.toggle_watchlist(acme.id));
    COSMOS_ASSERT(mgr.is_in_watchlist(acme.id));
    const auto ws = mgr.get_watchlist_stats();
    COSMOS_ASSERT(ws.total_companies == 1);
    COSMOS_ASSERT(ws.excellent_matches == 1);
    COSMOS_ASSERT(ws.total_open_roles == 4);

    // The two mutations were coalesced into one remote write.
    COSMOS_ASSERT(remote->calls == 0);
    COSMOS_ASSERT(queue.size() == 1);
    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 1);
    COSMOS_ASSERT(remote->last.user_id == kUserId);
    COSMOS_ASSERT(remote->last.companies.size() == 1);
    COSMOS_ASSERT(remote->last.preferences.watchlist_company_ids == std::vector<Id>{acme.id});
    COSMOS_ASSERT(remote->last.profile.target_role == "Staff Engineer");
    COSMOS_ASSERT(mgr.last_persist_result().saved);
    COSMOS_ASSERT(mgr.last_persist_result().backend == "remote");

    // Every mutation wrote the local snapshot synchronously.
    COSMOS_ASSERT(cache->writes() == 2);
    const auto cached = load_state_from_cache(*cache, "cosmos-exploration-state");
    COSMOS_ASSERT(cached.has_value());
    COSMOS_ASSERT(cached->watchlist_company_ids == std::vector<Id>{acme.id});
  }

  // Removal drops watchlist membership, restore does not bring it back.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), std::make_shared<MemoryKeyValueCache>(), remote_only(remote), queue);

    const Company c = mgr.add_company(company("Globex", 70.0));
    mgr.toggle_watchlist(c.id);
    mgr.set_selected_company(c.id);
    COSMOS_ASSERT(mgr.get_selected_company().has_value());

    mgr.remove_company(c.id);
    COSMOS_ASSERT(!mgr.is_in_watchlist(c.id));
    COSMOS_ASSERT(mgr.is_company_removed(c.id));
    COSMOS_ASSERT(!contains(mgr.get_all_companies(), c.id));
    COSMOS_ASSERT(!mgr.get_selected_company().has_value());
    COSMOS_ASSERT(mgr.get_current_state().added_companies.size() == 1);

    // Idempotent.
    const std::string before = serialize_state_to_json(mgr.get_current_state());
    mgr.remove_company(c.id);
    COSMOS_ASSERT(serialize_state_to_json(mgr.get_current_state()) == before);

    mgr.restore_company(c.id);
    COSMOS_ASSERT(contains(mgr.get_all_companies(), c.id));
    COSMOS_ASSERT(!mgr.is_in_watchlist(c.id));
    COSMOS_ASSERT(contains(mgr.get_displayed_companies(), c.id));

    const std::string restored = serialize_state_to_json(mgr.get_current_state());
    mgr.restore_company(c.id);
    COSMOS_ASSERT(serialize_state_to_json(mgr.get_current_state()) == restored);

    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 1);
  }

  // A restored company whose old slot was taken is re-placed.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), nullptr, remote_only(remote), queue);

    const Company x = mgr.add_company(company("X", 90.0));
    COSMOS_ASSERT(x.explore_position == (Placement{167.0, score_to_distance(90.0)}));
    mgr.remove_company(x.id);
    const Company y = mgr.add_company(company("Y", 90.0));
    COSMOS_ASSERT(y.explore_position == (Placement{174.0, score_to_distance(90.0)}));

    mgr.restore_company(x.id);
    const auto all = mgr.get_all_companies();
    COSMOS_ASSERT(all.size() == 2);
    COSMOS_ASSERT(!view_conflicts(all, ViewMode::Explore));
    const auto it = std::find_if(all.begin(), all.end(), [&](const Company& c) { return c.id == x.id; });
    COSMOS_ASSERT(it != all.end());
    COSMOS_ASSERT(it->explore_position != x.explore_position);
  }

  // Views are disjoint and cover every visible company; each view keeps its
  // own placement.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), nullptr, remote_only(remote), queue);

    std::vector<Id> ids;
    for (int i = 0; i < 12; ++i) ids.push_back(mgr.add_company(company("co" + std::to_string(i), 40.0 + 5.0 * i)).id);
    for (std::size_t i = 0; i < ids.size(); i += 3) mgr.toggle_watchlist(ids[i]);
    mgr.remove_company(ids[1]);

    mgr.set_view_mode(ViewMode::Explore);
    const auto explore = mgr.get_displayed_companies();
    mgr.set_view_mode(ViewMode::Watchlist);
    const auto watch = mgr.get_displayed_companies();
    COSMOS_ASSERT(mgr.get_view_mode() == ViewMode::Watchlist);

    COSMOS_ASSERT(explore.size() + watch.size() == mgr.get_all_companies().size());
    for (const auto& c : explore) COSMOS_ASSERT(!contains(watch, c.id));
    COSMOS_ASSERT(watch.size() == 4);
    COSMOS_ASSERT(!view_conflicts(explore, ViewMode::Explore));
    COSMOS_ASSERT(!view_conflicts(watch, ViewMode::Watchlist));
    for (const auto& c : watch) COSMOS_ASSERT(c.watchlist_position.has_value());

    // Leaving the watchlist keeps the watchlist placement untouched.
    const Company before = watch.front();
    COSMOS_ASSERT(!mgr.toggle_watchlist(before.id));
    const auto after = mgr.get_current_state();
    const Company* moved = find_company(after, before.id);
    COSMOS_ASSERT(moved != nullptr);
    COSMOS_ASSERT(moved->watchlist_position == before.watchlist_position);
    COSMOS_ASSERT(moved->explore_position.has_value());

    const auto stats = mgr.get_exploration_stats();
    COSMOS_ASSERT(stats.total == 11);
    COSMOS_ASSERT(stats.base == 0);
    COSMOS_ASSERT(stats.added == 12);
    COSMOS_ASSERT(stats.removed == 1);
    COSMOS_ASSERT(stats.watchlisted == 3);
    COSMOS_ASSERT(stats.view_mode == ViewMode::Watchlist);

    // Unknown and removed ids are ignored.
    COSMOS_ASSERT(!mgr.toggle_watchlist(424242));
    COSMOS_ASSERT(!mgr.toggle_watchlist(ids[1]));
    COSMOS_ASSERT(!mgr.is_in_watchlist(ids[1]));
  }

  // Exported state reloads into an equivalent manager.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), nullptr, remote_only(remote), queue);
    Company rich = company("Initech", 88.5, 3);
    rich.industry = "Software";
    rich.connections = {7, 9};
    rich.connection_types[7] = "competitor";
    rich.match_reasons = {"remote friendly"};
    rich.external_links.website = "https://initech.example";
    const Id a = mgr.add_company(rich).id;
    const Company umbrella = mgr.add_company(company("Umbrella", 12.0));
    mgr.toggle_watchlist(a);

    const std::string exported = serialize_state_to_json(mgr.get_current_state());
    TaskQueue queue2;
    ExplorationStateManager reloaded(deserialize_state_from_json(exported), nullptr, remote_only(remote), queue2);
    COSMOS_ASSERT(reloaded.get_all_companies() == mgr.get_all_companies());
    COSMOS_ASSERT(reloaded.is_in_watchlist(a));
    COSMOS_ASSERT(queue2.empty());

    // A supplied placement is kept when it is free.
    Company fixed = company("Pinned", 50.0);
    fixed.explore_position = Placement{10.0, 300.0};
    const Company stored = mgr.add_company(fixed);
    COSMOS_ASSERT(stored.explore_position == (Placement{10.0, 300.0}));

    // A supplied placement on top of an occupant is replaced.
    COSMOS_ASSERT(umbrella.explore_position.has_value());
    Company squatter = company("Squatter", 12.0);
    squatter.explore_position = umbrella.explore_position;
    const Company moved = mgr.add_company(squatter);
    COSMOS_ASSERT(moved.explore_position.has_value());
    COSMOS_ASSERT(!(moved.explore_position == umbrella.explore_position));
    COSMOS_ASSERT(!view_conflicts(mgr.get_displayed_companies(), ViewMode::Explore));
  }

  // A loaded snapshot that lists a company as both removed and watchlisted.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationState s = empty_state();
    Company five = company("Hooli", 70.0);
    five.id = 5;
    five.watchlist_position = Placement{40.0, 120.0};
    s.base_companies.push_back(five);
    Company six = company("Pied Piper", 70.0);
    six.id = 6;
    s.base_companies.push_back(six);
    s.removed_company_ids = {5};
    s.watchlist_company_ids = {5, 6};

    ExplorationStateManager mgr(s, nullptr, remote_only(remote), queue);
    COSMOS_ASSERT(!mgr.is_in_watchlist(5));
    COSMOS_ASSERT(mgr.is_in_watchlist(6));
    COSMOS_ASSERT(mgr.get_watchlist_stats().total_companies == 1);

    mgr.restore_company(5);
    COSMOS_ASSERT(!mgr.is_company_removed(5));
    COSMOS_ASSERT(!mgr.is_in_watchlist(5));
    mgr.set_view_mode(ViewMode::Explore);
    COSMOS_ASSERT(contains(mgr.get_displayed_companies(), 5));
    COSMOS_ASSERT(!contains(mgr.get_watchlist_companies(), 5));
  }


  // A burst of mutations produces one remote write carrying the latest state.
  {
    auto remote = std::make_shared<RecordingRemote>();
    auto cache = std::make_shared<MemoryKeyValueCache>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), cache, remote_only(remote), queue);

    const Id a = mgr.add_company(company("A", 60.0)).id;
    const Id b = mgr.add_company(company("B", 61.0)).id;
    mgr.add_company(company("C", 62.0));
    mgr.toggle_watchlist(a);
    mgr.remove_company(b);
    COSMOS_ASSERT(queue.size() == 1);
    COSMOS_ASSERT(mgr.has_pending_remote_write());

    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 1);
    COSMOS_ASSERT(remote->last.companies.size() == 3);
    COSMOS_ASSERT(remote->last.preferences.removed_company_ids == std::vector<Id>{b});
    COSMOS_ASSERT(!mgr.has_pending_remote_write());

    // Selection only touches the local cache.
    const int writes = cache->writes();
    mgr.set_selected_company(a);
    COSMOS_ASSERT(cache->writes() == writes + 1);
    COSMOS_ASSERT(queue.empty());
    COSMOS_ASSERT(!mgr.has_pending_remote_write());

    // A later burst schedules a new write.
    mgr.set_view_mode(ViewMode::Watchlist);
    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 2);
    COSMOS_ASSERT(remote->last.preferences.view_mode == ViewMode::Watchlist);

    // flush runs the pending write now; the queued task then has nothing to do.
    mgr.set_view_mode(ViewMode::Explore);
    mgr.flush_pending_writes();
    COSMOS_ASSERT(remote->calls == 3);
    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 3);
  }

  // A malformed identity token fails the deferred write loudly, after the
  // local write already happened.
  {
    auto remote = std::make_shared<RecordingRemote>();
    auto cache = std::make_shared<MemoryKeyValueCache>();
    TaskQueue queue;
    ExplorationState s = empty_state();
    s.id = "profile-123";
    ExplorationStateManager mgr(s, cache, remote_only(remote), queue);

    mgr.add_company(company("Acme", 90.0));
    COSMOS_ASSERT(cache->writes() == 1);

    std::string msg;
    try {
      queue.run_pending();
    } catch (const std::invalid_argument& e) {
      msg = e.what();
    }
    COSMOS_ASSERT(msg.rfind("Invalid userId", 0) == 0);
    COSMOS_ASSERT(msg.find("UUID") != std::string::npos);
    COSMOS_ASSERT(remote->calls == 0);

    bool threw = false;
    try {
      ExplorationStateManager::validate_user_id("");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    COSMOS_ASSERT(threw);
    ExplorationStateManager::validate_user_id(kUserId);
  }

  // A failing local cache never reaches the caller.
  {
    auto remote = std::make_shared<RecordingRemote>();
    auto cache = std::make_shared<FailingCache>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), cache, remote_only(remote), queue);

    const Company c = mgr.add_company(company("Acme", 90.0));
    mgr.set_selected_company(c.id);
    COSMOS_ASSERT(cache->attempts == 2);
    COSMOS_ASSERT(mgr.get_all_companies().size() == 1);
    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 1);
  }

  // In development a rejected remote save lands in a recovery snapshot.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "cosmos_test_manager_snapshots";
    dir /= std::to_string(static_cast<long long>(nonce));

    auto remote = std::make_shared<RecordingRemote>();
    remote->reject = true;
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), nullptr,
                                PersistencePolicy::standard(RuntimeEnvironment::Development, remote, dir.string()),
                                queue);
    const Id id = mgr.add_company(company("Acme", 90.0)).id;
    queue.run_pending();

    COSMOS_ASSERT(remote->calls == 1);
    const auto& r = mgr.last_persist_result();
    COSMOS_ASSERT(r.saved);
    COSMOS_ASSERT(r.backend == "recovery-snapshot");
    COSMOS_ASSERT(r.failures.size() == 1);

    RecoverySnapshotConfig cfg;
    cfg.dir = dir.string();
    const auto latest = RecoverySnapshotWriter(cfg).latest();
    COSMOS_ASSERT(latest.has_value());
    const auto snap = deserialize_state_from_json(read_text_file(*latest));
    COSMOS_ASSERT(find_company(snap, id) != nullptr);

    // Production has no fallback: the failure is only reported.
    TaskQueue queue2;
    ExplorationStateManager prod(empty_state(), nullptr,
                                 PersistencePolicy::standard(RuntimeEnvironment::Production, remote, dir.string()),
                                 queue2);
    prod.add_company(company("Acme", 90.0));
    queue2.run_pending();
    COSMOS_ASSERT(!prod.last_persist_result().saved);
    COSMOS_ASSERT(prod.last_persist_result().failures.size() == 1);

    fs::remove_all(dir, ec);
  }

  // Upsert versus strict replace.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationStateManager mgr(empty_state(), nullptr, remote_only(remote), queue);

    Company c = mgr.add_company(company("Acme", 90.0));
    c.open_roles = 12;
    const Company updated = mgr.update_company(c);
    COSMOS_ASSERT(updated.id == c.id);
    COSMOS_ASSERT(updated.open_roles == 12);
    COSMOS_ASSERT(mgr.get_current_state().added_companies.size() == 1);

    Company ghost = company("Ghost", 30.0);
    ghost.id = 5;
    const Company inserted = mgr.update_company(ghost);
    COSMOS_ASSERT(inserted.id == c.id + 1);
    COSMOS_ASSERT(mgr.get_current_state().added_companies.size() == 2);

    bool threw = false;
    ghost.id = 99999;
    try {
      mgr.replace_company(ghost);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    COSMOS_ASSERT(threw);
    COSMOS_ASSERT(mgr.get_current_state().added_companies.size() == 2);

    c.name = "Acme Corp";
    COSMOS_ASSERT(mgr.replace_company(c).name == "Acme Corp");
  }

  // Purging tombstones never lets an id come back.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    ExplorationState s = empty_state();
    Company base = company("Base", 50.0);
    base.id = 1;
    s.base_companies.push_back(base);
    ExplorationStateManager mgr(s, nullptr, remote_only(remote), queue);

    const Id a = mgr.add_company(company("A", 50.0)).id;
    const Id b = mgr.add_company(company("B", 50.0)).id;
    mgr.remove_company(b);
    mgr.remove_company(1);
    COSMOS_ASSERT(mgr.purge_removed_companies() == 1);
    COSMOS_ASSERT(mgr.purge_removed_companies() == 0);

    const auto st = mgr.get_current_state();
    COSMOS_ASSERT(st.added_companies.size() == 1);
    COSMOS_ASSERT(st.added_companies[0].id == a);
    COSMOS_ASSERT(st.removed_company_ids == std::vector<Id>{1});
    COSMOS_ASSERT(mgr.add_company(company("C", 50.0)).id == b + 1);
  }

  // Loading places companies that have no position yet, without persisting.
  {
    auto remote = std::make_shared<RecordingRemote>();
    auto cache = std::make_shared<MemoryKeyValueCache>();
    TaskQueue queue;
    ExplorationState s = empty_state();
    for (Id id = 1; id <= 30; ++id) {
      Company c = company("base" + std::to_string(id), 75.0);
      c.id = id;
      s.base_companies.push_back(c);
    }
    s.watchlist_company_ids = {3, 4};
    ExplorationStateManager mgr(s, cache, remote_only(remote), queue);

    const auto all = mgr.get_all_companies();
    for (const auto& c : all) {
      const bool watched = c.id == 3 || c.id == 4;
      COSMOS_ASSERT(placement_in(c, watched ? ViewMode::Watchlist : ViewMode::Explore).has_value());
    }
    mgr.set_view_mode(ViewMode::Explore);
    COSMOS_ASSERT(!view_conflicts(mgr.get_displayed_companies(), ViewMode::Explore));
    COSMOS_ASSERT(mgr.get_current_state().next_company_id == 31);
    COSMOS_ASSERT(cache->writes() == 1);
    queue.run_pending();
  }

  // A manager that is gone before its deferred write runs sends nothing.
  {
    auto remote = std::make_shared<RecordingRemote>();
    TaskQueue queue;
    {
      ExplorationStateManager mgr(empty_state(), nullptr, remote_only(remote), queue);
      mgr.add_company(company("Acme", 90.0));
    }
    COSMOS_ASSERT(queue.size() == 1);
    queue.run_pending();
    COSMOS_ASSERT(remote->calls == 0);
  }

  return 0;
}
