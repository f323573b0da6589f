#pragma once

#include "ScheduleCache.h"
#include "SlotClock.h"
#include "../rpc/IRpcClient.hpp"
#include "Service.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dt {
namespace tracker {

using LeaderWindow = std::vector<LeaderContact>;

/**
 * LeaderTracker - keeps the upcoming leader schedule in a local cache.
 *
 * The schedule is fetched from the query service on init and then refreshed
 * in a background thread. Window selection only reads the cache and the slot
 * clock, so it never waits on the network.
 */
class LeaderTracker : public Service {
public:
  struct Config {
    uint64_t lookahead{ 1000 };                   // slots fetched per refresh
    std::chrono::milliseconds refreshInterval{ 60000 };
    std::chrono::milliseconds retryBackoff{ 1000 }; // after a failed refresh
    uint64_t slotsPerLeaderTerm{ 4 };             // consecutive slots per leader
  };

  struct RefreshStats {
    uint64_t startSlot{ 0 };
    size_t scheduled{ 0 };      // slots written to the cache
    size_t missingLeaders{ 0 }; // slots whose leader is absent from the directory
    size_t unreachable{ 0 };    // slots whose leader has no TPU QUIC address
    size_t purged{ 0 };
  };

  static constexpr int32_t E_SLOT = 1;
  static constexpr int32_t E_LEADERS = 2;
  static constexpr int32_t E_CLUSTER_NODES = 3;

  LeaderTracker(rpc::IRpcClient &rpc, SlotClock &clock, const Config &config);
  LeaderTracker(rpc::IRpcClient &rpc, SlotClock &clock);
  ~LeaderTracker() override;

  /** Seed the slot clock from the query service */
  Roe<void> init();

  /** Fetch the schedule for the next lookahead slots and rebuild the cache */
  Roe<RefreshStats> refresh();

  /** Whether the most recent refresh succeeded */
  bool isScheduleFresh() const { return lastRefreshOk_; }

  /**
   * Up to n distinct leaders in slot order, starting offset slots from the
   * current slot. Returns fewer entries when the cache has gaps.
   */
  LeaderWindow getWindow(size_t n, int64_t offset) const;

  const ScheduleCache &getCache() const { return cache_; }
  const SlotClock &getClock() const { return clock_; }
  const Config &getConfig() const { return config_; }

protected:
  void runLoop() override;

private:
  Roe<RefreshStats> fetchSchedule();
  bool refreshAndLog();

  rpc::IRpcClient &rpc_;
  SlotClock &clock_;
  Config config_;
  ScheduleCache cache_;
  std::atomic<bool> lastRefreshOk_{ false };
};

} // namespace tracker
} // namespace dt
