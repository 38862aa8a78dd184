#include "cosmos/core/persistence.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "cosmos/util/file_io.h"
#include "cosmos/util/json.h"
#include "cosmos/util/log.h"
#include "cosmos/util/strings.h"

namespace cosmos {

// --- MemoryKeyValueCache ---

std::optional<std::string> MemoryKeyValueCache::get(const std::string& key) {
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void MemoryKeyValueCache::set(const std::string& key, const std::string& value) {
  values_[key] = value;
  ++writes_;
}

void MemoryKeyValueCache::remove(const std::string& key) { values_.erase(key); }

// --- FileKeyValueCache ---

FileKeyValueCache::FileKeyValueCache(std::string dir) : dir_(std::move(dir)) {
  if (dir_.empty()) throw std::invalid_argument("FileKeyValueCache: directory is empty");
}

std::string FileKeyValueCache::path_for(const std::string& key) const {
  std::string name;
  name.reserve(key.size());
  for (char ch : key) {
    const bool ok = std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '_' || ch == '-';
    name.push_back(ok ? ch : '_');
  }
  if (name.empty()) name = "_";
  return (std::filesystem::path(dir_) / (name + ".json")).string();
}

std::optional<std::string> FileKeyValueCache::get(const std::string& key) {
  const std::string path = path_for(key);
  if (!file_exists(path)) return std::nullopt;
  return read_text_file(path);
}

void FileKeyValueCache::set(const std::string& key, const std::string& value) {
  write_text_file(path_for(key), value);
}

void FileKeyValueCache::remove(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(path_for(key), ec);
  if (ec) throw std::runtime_error("Failed to remove cache entry '" + key + "': " + ec.message());
}

// --- CachedKeyValueCache ---

CachedKeyValueCache::CachedKeyValueCache(std::shared_ptr<KeyValueCache> inner) : inner_(std::move(inner)) {
  if (!inner_) throw std::invalid_argument("CachedKeyValueCache: inner cache is null");
}

std::optional<std::string> CachedKeyValueCache::get(const std::string& key) {
  auto it = memo_.find(key);
  if (it != memo_.end()) return it->second;

  std::optional<std::string> v;
  ++inner_reads_;
  try {
    v = inner_->get(key);
  } catch (const std::exception& e) {
    log::warn("cache: read of '" + key + "' failed: " + e.what());
  }
  memo_[key] = v;
  return v;
}

void CachedKeyValueCache::set(const std::string& key, const std::string& value) {
  inner_->set(key, value);
  memo_[key] = value;
}

void CachedKeyValueCache::remove(const std::string& key) {
  inner_->remove(key);
  memo_.erase(key);
}

void CachedKeyValueCache::invalidate(const std::string& key) { memo_.erase(key); }

void CachedKeyValueCache::clear() { memo_.clear(); }

// --- state <-> cache ---

CacheWriteResult write_state_to_cache(KeyValueCache& cache, const std::string& key, const ExplorationState& state) {
  CacheWriteResult r;
  try {
    cache.set(key, serialize_state_to_json(state, 0));
    r.ok = true;
  } catch (const std::exception& e) {
    r.error = e.what();
  }
  return r;
}

std::optional<ExplorationState> load_state_from_cache(KeyValueCache& cache, const std::string& key) {
  std::optional<std::string> text;
  try {
    text = cache.get(key);
  } catch (const std::exception& e) {
    log::warn("cache: failed to read '" + key + "': " + e.what());
    return std::nullopt;
  }
  if (!text) return std::nullopt;

  try {
    return deserialize_state_from_json(*text);
  } catch (const std::exception& e) {
    log::warn("cache: ignoring corrupt snapshot under '" + key + "': " + e.what());
    return std::nullopt;
  }
}

// --- JsonFileRemoteStore ---

JsonFileRemoteStore::JsonFileRemoteStore(std::string path) : path_(std::move(path)) {}

SaveResult JsonFileRemoteStore::save(const std::string& user_id, const UserProfile& profile,
                                     const std::vector<Company>& companies, const SavePreferences& preferences) {
  SaveResult r;
  if (path_.empty()) {
    r.error = "remote store path is empty";
    return r;
  }

  SavePayload payload;
  payload.user_id = user_id;
  payload.profile = profile;
  payload.companies = companies;
  payload.preferences = preferences;

  try {
    write_text_file(path_, serialize_save_payload_to_json(payload));
  } catch (const std::exception& e) {
    r.error = e.what();
    return r;
  }
  ++saves_;
  r.ok = true;
  return r;
}

// --- Backends ---

RemoteStoreBackend::RemoteStoreBackend(std::shared_ptr<RemoteStore> remote) : remote_(std::move(remote)) {
  if (!remote_) throw std::invalid_argument("RemoteStoreBackend: remote store is null");
}

SaveResult RemoteStoreBackend::save(const ExplorationState& state) {
  const SavePayload p = make_save_payload(state);
  return remote_->save(p.user_id, p.profile, p.companies, p.preferences);
}

RecoverySnapshotBackend::RecoverySnapshotBackend(RecoverySnapshotConfig cfg) : writer_(std::move(cfg)) {}

SaveResult RecoverySnapshotBackend::save(const ExplorationState& state) {
  const SnapshotResult snap = writer_.write(serialize_state_to_json(state));
  SaveResult r;
  r.ok = snap.saved;
  r.error = snap.error;
  if (snap.saved) log::warn("persist: wrote recovery snapshot " + snap.path);
  return r;
}

SaveResult LogDumpBackend::save(const ExplorationState& state) {
  json::Object dump;
  dump["user_id"] = state.id;
  dump["preferences"] = preferences_to_json(make_save_payload(state).preferences);
  json::Array added;
  for (const auto& c : state.added_companies) added.push_back(company_to_json(c));
  dump["added_companies"] = added;

  log::warn("persist: state could not be saved; recoverable copy follows");
  log::warn(json::stringify(dump, 2));
  SaveResult r;
  r.ok = true;
  return r;
}

// --- RuntimeEnvironment ---

const char* runtime_environment_to_string(RuntimeEnvironment env) {
  switch (env) {
    case RuntimeEnvironment::Production: return "production";
    case RuntimeEnvironment::Development: return "development";
    case RuntimeEnvironment::Test: return "test";
  }
  return "production";
}

bool parse_runtime_environment(const std::string& raw, RuntimeEnvironment& out) {
  const std::string s = to_lower(trim_copy(raw));
  if (s == "production" || s == "prod") {
    out = RuntimeEnvironment::Production;
  } else if (s == "development" || s == "dev") {
    out = RuntimeEnvironment::Development;
  } else if (s == "test") {
    out = RuntimeEnvironment::Test;
  } else {
    return false;
  }
  return true;
}

// --- PersistencePolicy ---

PersistencePolicy::PersistencePolicy(RuntimeEnvironment env) : env_(env) {}

PersistencePolicy& PersistencePolicy::add(std::shared_ptr<PersistenceBackend> backend,
                                          std::vector<RuntimeEnvironment> envs) {
  if (!backend) throw std::invalid_argument("PersistencePolicy::add: backend is null");
  entries_.push_back(Entry{std::move(backend), std::move(envs)});
  return *this;
}

bool PersistencePolicy::enabled(const Entry& e) const {
  return e.envs.empty() || std::find(e.envs.begin(), e.envs.end(), env_) != e.envs.end();
}

std::vector<std::string> PersistencePolicy::active_backends() const {
  std::vector<std::string> out;
  for (const auto& e : entries_) {
    if (enabled(e)) out.push_back(e.backend->name());
  }
  return out;
}

CascadeResult PersistencePolicy::persist(const ExplorationState& state) const {
  CascadeResult out;
  for (const auto& e : entries_) {
    if (!enabled(e)) continue;
    const std::string name = e.backend->name();

    SaveResult r;
    try {
      r = e.backend->save(state);
    } catch (const std::exception& ex) {
      r.ok = false;
      r.error = ex.what();
    }

    if (r.ok) {
      out.saved = true;
      out.backend = name;
      if (out.failures.empty()) {
        log::debug("persist: saved via " + name);
      } else {
        log::warn("persist: saved via fallback " + name);
      }
      return out;
    }

    const std::string msg = name + ": " + (r.error.empty() ? std::string("unknown error") : r.error);
    log::warn("persist: " + msg);
    out.failures.push_back(msg);
  }

  if (!out.failures.empty()) log::error("persist: every backend failed; changes remain in the local cache only");
  return out;
}

PersistencePolicy PersistencePolicy::standard(RuntimeEnvironment env, std::shared_ptr<RemoteStore> remote,
                                              const std::string& snapshot_dir) {
  PersistencePolicy p(env);
  if (remote) p.add(std::make_shared<RemoteStoreBackend>(std::move(remote)));
  if (!snapshot_dir.empty()) {
    RecoverySnapshotConfig cfg;
    cfg.dir = snapshot_dir;
    p.add(std::make_shared<RecoverySnapshotBackend>(std::move(cfg)), {RuntimeEnvironment::Development});
  }
  p.add(std::make_shared<LogDumpBackend>(), {RuntimeEnvironment::Development});
  return p;
}

} // namespace cosmos
