#include "cosmos/util/recovery_snapshots.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "cosmos/util/file_io.h"

namespace cosmos {
namespace {

namespace fs = std::filesystem;

constexpr int kSequenceWidth = 6;

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Extracts the sequence number between prefix and extension.
std::optional<std::uint64_t> parse_sequence(const std::string& name, const RecoverySnapshotConfig& cfg) {
  if (!starts_with(name, cfg.prefix) || !ends_with(name, cfg.extension)) return std::nullopt;
  if (name.size() <= cfg.prefix.size() + cfg.extension.size()) return std::nullopt;
  const std::string digits = name.substr(cfg.prefix.size(), name.size() - cfg.prefix.size() - cfg.extension.size());
  std::uint64_t seq = 0;
  for (char ch : digits) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
    seq = seq * 10 + static_cast<std::uint64_t>(ch - '0');
  }
  return seq;
}

std::string padded(std::uint64_t seq) {
  std::string s = std::to_string(seq);
  if (s.size() < static_cast<std::size_t>(kSequenceWidth)) {
    s.insert(0, static_cast<std::size_t>(kSequenceWidth) - s.size(), '0');
  }
  return s;
}

SnapshotScanResult scan_impl(const RecoverySnapshotConfig& cfg) {
  SnapshotScanResult out;
  std::error_code ec;
  const fs::path dir(cfg.dir);
  if (cfg.dir.empty() || !fs::exists(dir, ec) || ec) {
    out.ok = true;
    return out;
  }

  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (ec) break;
    if (!entry.is_regular_file(ec) || ec) continue;

    const std::string name = entry.path().filename().string();
    const auto seq = parse_sequence(name, cfg);
    if (!seq) continue;

    SnapshotInfo info;
    info.path = entry.path().string();
    info.filename = name;
    info.sequence = *seq;
    info.size_bytes = entry.file_size(ec);
    if (ec) {
      ec.clear();
      info.size_bytes = 0;
    }
    out.files.push_back(std::move(info));
  }
  if (ec) {
    out.error = "failed to scan " + cfg.dir + ": " + ec.message();
    return out;
  }

  std::sort(out.files.begin(), out.files.end(),
            [](const SnapshotInfo& a, const SnapshotInfo& b) { return a.sequence > b.sequence; });
  out.ok = true;
  return out;
}

int prune_impl(const RecoverySnapshotConfig& cfg, std::string* error) {
  if (cfg.keep_files <= 0 || cfg.dir.empty()) return 0;

  const SnapshotScanResult scan = scan_impl(cfg);
  if (!scan.ok) {
    if (error) *error = scan.error;
    return -1;
  }
  if (static_cast<int>(scan.files.size()) <= cfg.keep_files) return 0;

  int removed = 0;
  for (std::size_t i = static_cast<std::size_t>(cfg.keep_files); i < scan.files.size(); ++i) {
    std::error_code ec;
    fs::remove(fs::path(scan.files[i].path), ec);
    if (!ec) ++removed;
  }
  return removed;
}

} // namespace

SnapshotScanResult scan_recovery_snapshots(const RecoverySnapshotConfig& cfg) {
  try {
    return scan_impl(cfg);
  } catch (const std::exception& e) {
    SnapshotScanResult out;
    out.error = e.what();
    return out;
  }
}

int prune_recovery_snapshots(const RecoverySnapshotConfig& cfg, std::string* error) {
  try {
    return prune_impl(cfg, error);
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return -1;
  }
}

RecoverySnapshotWriter::RecoverySnapshotWriter(RecoverySnapshotConfig cfg) : cfg_(std::move(cfg)) {}

SnapshotResult RecoverySnapshotWriter::write(const std::string& contents) {
  SnapshotResult r;
  if (cfg_.dir.empty()) {
    r.error = "recovery snapshot directory is empty";
    return r;
  }
  if (cfg_.prefix.empty()) {
    r.error = "recovery snapshot prefix is empty";
    return r;
  }

  const SnapshotScanResult scan = scan_recovery_snapshots(cfg_);
  if (!scan.ok) {
    r.error = scan.error;
    return r;
  }
  const std::uint64_t next = scan.files.empty() ? 1 : scan.files.front().sequence + 1;
  const fs::path path = fs::path(cfg_.dir) / (cfg_.prefix + padded(next) + cfg_.extension);

  try {
    write_text_file(path.string(), contents);
  } catch (const std::exception& e) {
    r.error = e.what();
    return r;
  }

  r.saved = true;
  r.path = path.string();

  // Snapshot succeeded; pruning is best-effort.
  const int pruned = prune_recovery_snapshots(cfg_);
  r.pruned = pruned < 0 ? 0 : pruned;
  return r;
}

std::optional<std::string> RecoverySnapshotWriter::latest() const {
  const SnapshotScanResult scan = scan_recovery_snapshots(cfg_);
  if (!scan.ok || scan.files.empty()) return std::nullopt;
  return scan.files.front().path;
}

} // namespace cosmos
