#pragma once

#include "../network/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace dt {
namespace tracker {

struct LeaderContact {
  std::string identity;
  // Absent when the leader advertises no ingestion address
  std::optional<network::IpEndpoint> ingestion;

  bool isReachable() const { return ingestion.has_value(); }
};

/**
 * Upcoming slot -> leader map. Every operation locks on its own, so a reader
 * running next to a refresh sees each entry either before or after its update.
 */
class ScheduleCache {
public:
  void upsert(uint64_t slot, const LeaderContact &contact);
  std::optional<LeaderContact> find(uint64_t slot) const;

  /** Entries with start <= slot < end, in slot order */
  std::vector<std::pair<uint64_t, LeaderContact>> range(uint64_t start,
                                                        uint64_t end) const;

  /** Remove every entry below slot; returns the number removed */
  size_t purgeBefore(uint64_t slot);

  size_t size() const;
  bool empty() const { return size() == 0; }
  void clear();

  /** Lowest cached slot, std::nullopt when empty */
  std::optional<uint64_t> firstSlot() const;

private:
  mutable std::shared_mutex mutex_;
  std::map<uint64_t, LeaderContact> entries_;
};

} // namespace tracker
} // namespace dt
