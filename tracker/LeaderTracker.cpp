#include "LeaderTracker.h"

#include "Utilities.h"

#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace dt {
namespace tracker {

LeaderTracker::LeaderTracker(rpc::IRpcClient &rpc, SlotClock &clock,
                             const Config &config)
    : Service("tracker.leader_tracker"), rpc_(rpc), clock_(clock),
      config_(config) {}

LeaderTracker::LeaderTracker(rpc::IRpcClient &rpc, SlotClock &clock)
    : LeaderTracker(rpc, clock, Config{}) {}

LeaderTracker::~LeaderTracker() { stop(); }

LeaderTracker::Roe<void> LeaderTracker::init() {
  auto slot = rpc_.getSlot();
  if (!slot) {
    return Error(E_SLOT, "Failed to get current slot: " + slot.error().message);
  }
  clock_.advance(slot.value());
  log().info << "Current slot " << clock_.read();
  return {};
}

LeaderTracker::Roe<LeaderTracker::RefreshStats> LeaderTracker::refresh() {
  auto result = fetchSchedule();
  lastRefreshOk_ = result.isOk();
  return result;
}

LeaderTracker::Roe<LeaderTracker::RefreshStats> LeaderTracker::fetchSchedule() {
  auto slot = rpc_.getSlot();
  if (!slot) {
    return Error(E_SLOT, "Failed to get current slot: " + slot.error().message);
  }
  clock_.advance(slot.value());

  RefreshStats stats;
  stats.startSlot = clock_.read();

  auto leaders = rpc_.getSlotLeaders(stats.startSlot, config_.lookahead);
  if (!leaders) {
    return Error(E_LEADERS, "Failed to get slot leaders from " +
                                std::to_string(stats.startSlot) + ": " +
                                leaders.error().message);
  }

  auto nodes = rpc_.getClusterNodes();
  if (!nodes) {
    return Error(E_CLUSTER_NODES,
                 "Failed to get cluster nodes: " + nodes.error().message);
  }

  std::unordered_map<std::string, const rpc::ClusterNode *> directory;
  for (const auto &node : nodes.value()) {
    directory[node.pubkey] = &node;
  }

  std::unordered_set<std::string> reported;
  const auto &schedule = leaders.value();
  for (size_t i = 0; i < schedule.size(); ++i) {
    uint64_t slotNumber = stats.startSlot + i;
    const std::string &identity = schedule[i];

    auto it = directory.find(identity);
    if (it == directory.end()) {
      ++stats.missingLeaders;
      if (reported.insert(identity).second) {
        log().error << "Leader " << identity << " of slot " << slotNumber
                    << " is not in the cluster node list";
      }
      continue;
    }

    LeaderContact contact;
    contact.identity = identity;
    // Only the QUIC port accepts transactions
    const auto &address = it->second->tpuQuic;
    if (address) {
      contact.ingestion = network::IpEndpoint::fromString(*address);
      if (!contact.ingestion) {
        log().warning << "Leader " << identity << " has malformed TPU QUIC address '"
                      << *address << "'";
      }
    }
    if (!contact.ingestion) {
      ++stats.unreachable;
    }

    cache_.upsert(slotNumber, contact);
    ++stats.scheduled;
  }

  stats.purged = cache_.purgeBefore(clock_.read());

  log().debug << "Schedule refreshed from slot " << stats.startSlot << ": "
              << stats.scheduled << " scheduled, " << stats.missingLeaders
              << " unknown, " << stats.unreachable << " unreachable, "
              << stats.purged << " purged";
  return stats;
}

LeaderWindow LeaderTracker::getWindow(size_t n, int64_t offset) const {
  LeaderWindow window;
  if (n == 0) {
    return window;
  }

  const uint64_t max = std::numeric_limits<uint64_t>::max();
  uint64_t current = clock_.read();
  uint64_t start;
  if (offset < 0) {
    // -(offset + 1) + 1 stays representable for INT64_MIN
    uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
    start = back > current ? 0 : current - back;
  } else {
    uint64_t ahead = static_cast<uint64_t>(offset);
    start = ahead > max - current ? max : current + ahead;
  }

  uint64_t term = config_.slotsPerLeaderTerm;
  uint64_t span = term != 0 && n > max / term ? max : static_cast<uint64_t>(n) * term;
  uint64_t end = span > max - start ? max : start + span;

  std::unordered_set<std::string> seen;
  for (const auto &entry : cache_.range(start, end)) {
    if (!seen.insert(entry.second.identity).second) {
      continue;
    }
    window.push_back(entry.second);
    if (window.size() == n) {
      break;
    }
  }

  if (log().isEnabledFor(logging::Level::DEBUG)) {
    std::vector<std::string> identities;
    for (const auto &contact : window) {
      identities.push_back(contact.identity);
    }
    log().debug << "Window from slot " << start << ": ["
                << utl::join(identities, ", ") << "]";
  }
  return window;
}

bool LeaderTracker::refreshAndLog() {
  auto result = refresh();
  if (!result) {
    log().error << "Schedule refresh failed: " << result.error().message;
    return false;
  }
  return true;
}

void LeaderTracker::runLoop() {
  // A schedule that is already fresh waits a full interval
  bool ok = lastRefreshOk_ ? true : refreshAndLog();
  while (waitFor(ok ? config_.refreshInterval : config_.retryBackoff)) {
    ok = refreshAndLog();
  }
}

} // namespace tracker
} // namespace dt
