#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cosmos {

// Rolling on-disk snapshots used as a recoverable fallback when the remote
// store rejects a save.
//
// Files are named <prefix><sequence><extension> with a zero-padded sequence
// number, written with write_text_file's temp+rename strategy, and bounded
// to the newest keep_files.
struct RecoverySnapshotConfig {
  std::string dir{"recovery"};
  std::string prefix{"exploration_"};
  std::string extension{".json"};

  // Values <= 0 disable pruning.
  int keep_files{10};
};

struct SnapshotInfo {
  std::string path;
  std::string filename;
  std::uint64_t sequence{0};
  std::uintmax_t size_bytes{0};
};

struct SnapshotScanResult {
  bool ok{false};
  std::string error;
  // Newest (highest sequence) first.
  std::vector<SnapshotInfo> files;
};

struct SnapshotResult {
  bool saved{false};
  std::string path;
  int pruned{0};
  std::string error;
};

SnapshotScanResult scan_recovery_snapshots(const RecoverySnapshotConfig& cfg);

// Removes snapshots beyond cfg.keep_files. Returns the number removed, or -1
// on failure (error filled when non-null).
int prune_recovery_snapshots(const RecoverySnapshotConfig& cfg, std::string* error = nullptr);

class RecoverySnapshotWriter {
 public:
  explicit RecoverySnapshotWriter(RecoverySnapshotConfig cfg);

  // Writes `contents` as the next snapshot, then prunes. Never throws.
  SnapshotResult write(const std::string& contents);

  // Path of the newest snapshot on disk, if any.
  std::optional<std::string> latest() const;

  const RecoverySnapshotConfig& config() const { return cfg_; }

 private:
  RecoverySnapshotConfig cfg_;
};

} // namespace cosmos
