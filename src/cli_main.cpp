#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cosmos/core/config.h"
#include "cosmos/core/exploration_state_manager.h"
#include "cosmos/core/persistence.h"
#include "cosmos/core/placement_analysis.h"
#include "cosmos/core/serialization.h"
#include "cosmos/core/state_validation.h"
#include "cosmos/core/task_queue.h"
#include "cosmos/util/file_io.h"
#include "cosmos/util/log.h"
#include "cosmos/util/strings.h"

namespace {

#ifndef COSMOS_VERSION
#define COSMOS_VERSION "unknown"
#endif

const std::vector<std::string> kValueOptions = {"--state",   "--cache-dir", "--remote-file", "--snapshot-dir",
                                                "--env",     "--config",    "--log-level"};

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// Everything that is neither an option nor an option's value.
std::vector<std::string> positional_args(int argc, char** argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (std::find(kValueOptions.begin(), kValueOptions.end(), a) != kValueOptions.end()) {
      ++i;
      continue;
    }
    if (a.rfind("--", 0) == 0) continue;
    out.push_back(a);
  }
  return out;
}

bool parse_id(const std::string& raw, cosmos::Id& out) {
  std::int64_t v = 0;
  if (!cosmos::parse_decimal_int64(raw, v)) return false;
  out = static_cast<cosmos::Id>(v);
  return true;
}

void print_usage(const char* exe) {
  std::cout << "Cosmos CLI v" << COSMOS_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "cosmos_cli") << " [options] <command> [args]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --state PATH         Initial exploration state JSON\n";
  std::cout << "  --cache-dir DIR      Local cache directory; a cached snapshot for the same user wins over --state\n";
  std::cout << "  --remote-file PATH   File standing in for the remote store\n";
  std::cout << "  --snapshot-dir DIR   Recovery snapshot directory (development only)\n";
  std::cout << "  --env NAME           production|development|test (default: production)\n";
  std::cout << "  --config PATH        Manager/positioning config JSON\n";
  std::cout << "  --log-level LEVEL    debug|info|warn|error|off (default: info)\n";
  std::cout << "  -h, --help           Show this help\n";
  std::cout << "  --version            Print version and exit\n\n";
  std::cout << "Commands:\n";
  std::cout << "  list                      Companies in the current view\n";
  std::cout << "  stats                     Exploration and watchlist statistics\n";
  std::cout << "  add NAME SCORE [ROLES]    Add a company\n";
  std::cout << "  remove ID | restore ID    Tombstone / restore a company\n";
  std::cout << "  watch ID                  Toggle watchlist membership\n";
  std::cout << "  view explore|watchlist    Switch the view mode\n";
  std::cout << "  select ID                 Select a company\n";
  std::cout << "  validate                  Check state invariants\n";
  std::cout << "  analyze                   Audit placements in the current view\n";
  std::cout << "  dump                      Print the state JSON\n";
}

void print_company(const cosmos::Company& c, cosmos::ViewMode view) {
  std::cout << "  #" << c.id << "  " << c.name << "  score " << c.match_score;
  if (const auto& p = cosmos::placement_in(c, view)) {
    std::cout << std::fixed << std::setprecision(1) << "  @ " << p->angle << " deg, " << p->distance << " px";
    std::cout.unsetf(std::ios::fixed);
    std::cout << std::setprecision(6);
  } else {
    std::cout << "  (unplaced)";
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << COSMOS_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "info");
    cosmos::log::Level lvl = cosmos::log::Level::Info;
    if (!cosmos::log::parse_level(log_level, lvl)) {
      std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    cosmos::log::set_level(lvl);

    const std::string env_name = get_str_arg(argc, argv, "--env", "production");
    cosmos::RuntimeEnvironment env = cosmos::RuntimeEnvironment::Production;
    if (!cosmos::parse_runtime_environment(env_name, env)) {
      std::cerr << "Unknown --env: '" << env_name << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const std::vector<std::string> args = positional_args(argc, argv);
    if (args.empty()) {
      print_usage(argv[0]);
      return 2;
    }
    const std::string& cmd = args[0];

    cosmos::ManagerConfig cfg;
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    if (!config_path.empty()) cfg = cosmos::load_manager_config_from_json(cosmos::read_text_file(config_path));

    std::shared_ptr<cosmos::KeyValueCache> cache;
    const std::string cache_dir = get_str_arg(argc, argv, "--cache-dir", "");
    if (!cache_dir.empty()) {
      cache = std::make_shared<cosmos::CachedKeyValueCache>(std::make_shared<cosmos::FileKeyValueCache>(cache_dir));
    } else {
      cache = std::make_shared<cosmos::MemoryKeyValueCache>();
    }

    std::optional<cosmos::ExplorationState> state;
    const std::string state_path = get_str_arg(argc, argv, "--state", "");
    if (!state_path.empty()) state = cosmos::deserialize_state_from_json(cosmos::read_text_file(state_path));

    if (auto cached = cosmos::load_state_from_cache(*cache, cfg.cache_key)) {
      if (!state || cached->id == state->id) {
        cosmos::log::info("Using cached exploration state for '" + cached->name + "'");
        state = std::move(cached);
      }
    }
    if (!state) {
      std::cerr << "No exploration state: pass --state or a --cache-dir holding a snapshot\n";
      return 2;
    }

    std::shared_ptr<cosmos::RemoteStore> remote;
    const std::string remote_path = get_str_arg(argc, argv, "--remote-file", "");
    if (!remote_path.empty()) remote = std::make_shared<cosmos::JsonFileRemoteStore>(remote_path);

    cosmos::PersistencePolicy policy =
        cosmos::PersistencePolicy::standard(env, remote, get_str_arg(argc, argv, "--snapshot-dir", ""));

    cosmos::TaskQueue queue;
    cosmos::ExplorationStateManager mgr(std::move(*state), cache, std::move(policy), queue, cfg);

    const auto need_id = [&](cosmos::Id& id) {
      if (args.size() < 2 || !parse_id(args[1], id)) {
        std::cerr << "'" << cmd << "' requires a numeric company id\n";
        return false;
      }
      return true;
    };

    int rc = 0;
    cosmos::Id id = cosmos::kInvalidId;

    if (cmd == "list") {
      const cosmos::ViewMode view = mgr.get_view_mode();
      const auto companies = mgr.get_displayed_companies();
      std::cout << cosmos::view_mode_to_string(view) << " (" << companies.size() << ")\n";
      for (const auto& c : companies) print_company(c, view);
    } else if (cmd == "stats") {
      const auto es = mgr.get_exploration_stats();
      const auto ws = mgr.get_watchlist_stats();
      std::cout << "Total:       " << es.total << "\n";
      std::cout << "Base:        " << es.base << "\n";
      std::cout << "Added:       " << es.added << "\n";
      std::cout << "Removed:     " << es.removed << "\n";
      std::cout << "Watchlisted: " << es.watchlisted << "\n";
      std::cout << "View:        " << cosmos::view_mode_to_string(es.view_mode) << "\n";
      std::cout << "Watchlist:   " << ws.total_companies << " companies, " << ws.excellent_matches
                << " excellent, " << ws.total_open_roles << " open roles\n";
    } else if (cmd == "add") {
      if (args.size() < 3) {
        std::cerr << "'add' requires NAME and SCORE\n";
        return 2;
      }
      cosmos::Company c;
      c.name = args[1];
      try {
        c.match_score = std::stod(args[2]);
      } catch (const std::logic_error&) {
        std::cerr << "'add' SCORE must be a number, got '" << args[2] << "'\n";
        return 2;
      }
      if (args.size() > 3) {
        std::int64_t roles = 0;
        if (!cosmos::parse_decimal_int64(args[3], roles) || roles > std::numeric_limits<int>::max()) {
          std::cerr << "'add' OPEN_ROLES must be a non-negative integer, got '" << args[3] << "'\n";
          return 2;
        }
        c.open_roles = static_cast<int>(roles);
      }
      const cosmos::Company stored = mgr.add_company(c);
      std::cout << "Added:\n";
      print_company(stored, cosmos::ViewMode::Explore);
    } else if (cmd == "remove") {
      if (!need_id(id)) return 2;
      mgr.remove_company(id);
    } else if (cmd == "restore") {
      if (!need_id(id)) return 2;
      mgr.restore_company(id);
    } else if (cmd == "watch") {
      if (!need_id(id)) return 2;
      const bool on = mgr.toggle_watchlist(id);
      std::cout << "#" << id << (on ? " is on the watchlist\n" : " is not on the watchlist\n");
    } else if (cmd == "view") {
      cosmos::ViewMode mode = cosmos::ViewMode::Explore;
      if (args.size() < 2 || !cosmos::parse_view_mode(args[1], mode)) {
        std::cerr << "'view' requires explore or watchlist\n";
        return 2;
      }
      mgr.set_view_mode(mode);
    } else if (cmd == "select") {
      if (!need_id(id)) return 2;
      mgr.set_selected_company(id);
      if (const auto sel = mgr.get_selected_company()) {
        print_company(*sel, mgr.is_in_watchlist(id) ? cosmos::ViewMode::Watchlist : cosmos::ViewMode::Explore);
      } else {
        std::cerr << "Warning: #" << id << " is not a visible company\n";
      }
    } else if (cmd == "validate") {
      const auto errors = cosmos::validate_exploration_state(mgr.get_current_state());
      if (!errors.empty()) {
        std::cerr << "State validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        rc = 1;
      } else {
        std::cout << "State OK\n";
      }
    } else if (cmd == "analyze") {
      const auto report = cosmos::analyze_placements(mgr.get_displayed_companies(), mgr.get_view_mode(),
                                                     mgr.config().positioning);
      std::cout << cosmos::format_placement_report(report);
    } else if (cmd == "dump") {
      std::cout << cosmos::serialize_state_to_json(mgr.get_current_state()) << "\n";
    } else {
      std::cerr << "Unknown command: '" << cmd << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    queue.run_pending();
    const auto& persisted = mgr.last_persist_result();
    if (mgr.remote_writes() > 0 && !persisted.saved) {
      std::cerr << "Warning: changes were not persisted remotely\n";
    }
    return rc;
  } catch (const std::exception& e) {
    cosmos::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
