#include "cosmos/util/data_sync.h"

#include <chrono>
#include <exception>
#include <utility>

#include "cosmos/util/log.h"

namespace cosmos {
namespace {

std::int64_t steady_now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

DataSyncChecker::DataSyncChecker(FetchFn fetch, ClockFn clock, std::int64_t min_interval_ms)
    : fetch_(std::move(fetch)),
      clock_(clock ? std::move(clock) : ClockFn(steady_now_ms)),
      min_interval_ms_(min_interval_ms < 0 ? 0 : min_interval_ms) {}

bool DataSyncChecker::check() {
  if (!enabled_ || !known_ || !fetch_) return false;

  const std::int64_t now = clock_();
  if (last_check_ms_ && now - *last_check_ms_ < min_interval_ms_) return false;
  last_check_ms_ = now;
  ++checks_performed_;

  std::optional<DataVersion> server;
  try {
    server = fetch_();
  } catch (const std::exception& e) {
    log::debug(std::string("data sync: version check failed: ") + e.what());
    return false;
  }
  if (!server) return false;

  const bool stale = server->company_data_updated_at != known_->company_data_updated_at ||
                     server->preferences_updated_at != known_->preferences_updated_at;
  if (stale) log::info("data sync: server data is newer than the local copy");
  return stale;
}

} // namespace cosmos
