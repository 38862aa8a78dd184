#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace cosmos {

// Server-side modification stamps of a user's data. Opaque strings; only
// equality matters.
struct DataVersion {
  std::optional<std::string> company_data_updated_at;
  std::optional<std::string> preferences_updated_at;

  bool operator==(const DataVersion&) const = default;
};

// Decides whether locally held data is stale compared to the server.
//
// Checks are rate limited to one per min_interval_ms. A fetch that returns
// nullopt or throws is treated as "not stale" (offline is expected).
class DataSyncChecker {
 public:
  using FetchFn = std::function<std::optional<DataVersion>()>;
  // Milliseconds on any monotonic scale.
  using ClockFn = std::function<std::int64_t()>;

  static constexpr std::int64_t kDefaultMinIntervalMs = 10000;

  explicit DataSyncChecker(FetchFn fetch, ClockFn clock = {}, std::int64_t min_interval_ms = kDefaultMinIntervalMs);

  // Versions from the most recent full load. Without them check() is a no-op.
  void set_known_versions(std::optional<DataVersion> v) { known_ = std::move(v); }
  const std::optional<DataVersion>& known_versions() const { return known_; }

  void set_enabled(bool enabled) { enabled_ = enabled; }
  bool enabled() const { return enabled_; }

  // True when the server reports a different version for either stamp.
  bool check();

  int checks_performed() const { return checks_performed_; }

 private:
  FetchFn fetch_;
  ClockFn clock_;
  std::int64_t min_interval_ms_;
  std::optional<DataVersion> known_;
  std::optional<std::int64_t> last_check_ms_;
  bool enabled_{true};
  int checks_performed_{0};
};

} // namespace cosmos
