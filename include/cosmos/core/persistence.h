#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cosmos/core/exploration_state.h"
#include "cosmos/core/serialization.h"
#include "cosmos/util/recovery_snapshots.h"

namespace cosmos {

// --- Local durable cache ---

// String key/value store that survives a restart.
//
// get() returns nullopt for a missing key. set() and remove() throw
// (std::runtime_error or a subclass) when the underlying storage fails.
class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;
  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual void set(const std::string& key, const std::string& value) = 0;
  virtual void remove(const std::string& key) = 0;
};

class MemoryKeyValueCache : public KeyValueCache {
 public:
  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;
  void remove(const std::string& key) override;

  int writes() const { return writes_; }

 private:
  std::unordered_map<std::string, std::string> values_;
  int writes_{0};
};

// One file per key under `dir`. Characters outside [A-Za-z0-9._-] in a key
// are replaced by '_' to form the filename.
class FileKeyValueCache : public KeyValueCache {
 public:
  explicit FileKeyValueCache(std::string dir);

  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;
  void remove(const std::string& key) override;

  std::string path_for(const std::string& key) const;

 private:
  std::string dir_;
};

// Memoizes reads of another cache. Writes go through and update the memo.
// A failed read is remembered as "missing" until invalidated.
class CachedKeyValueCache : public KeyValueCache {
 public:
  explicit CachedKeyValueCache(std::shared_ptr<KeyValueCache> inner);

  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;
  void remove(const std::string& key) override;

  // Drop memoized values (e.g. when the storage may have changed externally).
  void invalidate(const std::string& key);
  void clear();

  int inner_reads() const { return inner_reads_; }

 private:
  std::shared_ptr<KeyValueCache> inner_;
  std::unordered_map<std::string, std::optional<std::string>> memo_;
  int inner_reads_{0};
};

struct CacheWriteResult {
  bool ok{false};
  std::string error;
};

// Writes the full state snapshot under `key`. Never throws.
CacheWriteResult write_state_to_cache(KeyValueCache& cache, const std::string& key, const ExplorationState& state);

// Reads a previously cached snapshot. Missing, unreadable or corrupt entries
// yield nullopt (the latter two with a warning).
std::optional<ExplorationState> load_state_from_cache(KeyValueCache& cache, const std::string& key);

// --- Remote store ---

struct SaveResult {
  bool ok{false};
  std::string error;
};

// The remote persistence service. Implementations report rejection through
// SaveResult and may throw on transport failure.
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;
  virtual SaveResult save(const std::string& user_id, const UserProfile& profile,
                          const std::vector<Company>& companies, const SavePreferences& preferences) = 0;
};

// Stores the latest save payload as a JSON file.
class JsonFileRemoteStore : public RemoteStore {
 public:
  explicit JsonFileRemoteStore(std::string path);

  SaveResult save(const std::string& user_id, const UserProfile& profile, const std::vector<Company>& companies,
                  const SavePreferences& preferences) override;

  const std::string& path() const { return path_; }
  int saves() const { return saves_; }

 private:
  std::string path_;
  int saves_{0};
};

// --- Backends and policy ---

class PersistenceBackend {
 public:
  virtual ~PersistenceBackend() = default;
  virtual std::string name() const = 0;
  virtual SaveResult save(const ExplorationState& state) = 0;
};

class RemoteStoreBackend : public PersistenceBackend {
 public:
  explicit RemoteStoreBackend(std::shared_ptr<RemoteStore> remote);
  std::string name() const override { return "remote"; }
  SaveResult save(const ExplorationState& state) override;

 private:
  std::shared_ptr<RemoteStore> remote_;
};

// Writes the full state as a rolling recovery snapshot file.
class RecoverySnapshotBackend : public PersistenceBackend {
 public:
  explicit RecoverySnapshotBackend(RecoverySnapshotConfig cfg);
  std::string name() const override { return "recovery-snapshot"; }
  SaveResult save(const ExplorationState& state) override;

  const RecoverySnapshotWriter& writer() const { return writer_; }

 private:
  RecoverySnapshotWriter writer_;
};

// Last resort: prints the user's preferences and added companies through the
// logger so they can be recovered by hand. Always succeeds.
class LogDumpBackend : public PersistenceBackend {
 public:
  std::string name() const override { return "log-dump"; }
  SaveResult save(const ExplorationState& state) override;
};

enum class RuntimeEnvironment { Production, Development, Test };

const char* runtime_environment_to_string(RuntimeEnvironment env);

// Accepts "production"/"prod", "development"/"dev", "test" (case-insensitive).
bool parse_runtime_environment(const std::string& raw, RuntimeEnvironment& out);

struct CascadeResult {
  bool saved{false};
  // Name of the backend that accepted the save.
  std::string backend;
  // "<backend>: <error>" for every backend that was tried and failed.
  std::vector<std::string> failures;
};

// Ranked list of persistence backends, each enabled for a set of
// environments. persist() tries the entries enabled for the current
// environment in order and stops at the first success.
class PersistencePolicy {
 public:
  explicit PersistencePolicy(RuntimeEnvironment env = RuntimeEnvironment::Production);

  // An empty environment list enables the backend everywhere.
  PersistencePolicy& add(std::shared_ptr<PersistenceBackend> backend, std::vector<RuntimeEnvironment> envs = {});

  // Never throws for backend failures; each is logged and recorded.
  CascadeResult persist(const ExplorationState& state) const;

  RuntimeEnvironment environment() const { return env_; }
  std::vector<std::string> active_backends() const;

  // remote (everywhere), then recovery snapshots and a log dump in
  // development. A null remote or empty snapshot_dir skips that entry.
  static PersistencePolicy standard(RuntimeEnvironment env, std::shared_ptr<RemoteStore> remote,
                                    const std::string& snapshot_dir);

 private:
  struct Entry {
    std::shared_ptr<PersistenceBackend> backend;
    std::vector<RuntimeEnvironment> envs;
  };

  bool enabled(const Entry& e) const;

  RuntimeEnvironment env_;
  std::vector<Entry> entries_;
};

} // namespace cosmos
