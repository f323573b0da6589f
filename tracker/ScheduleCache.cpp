#include "ScheduleCache.h"

#include <iterator>
#include <mutex>

namespace dt {
namespace tracker {

void ScheduleCache::upsert(uint64_t slot, const LeaderContact &contact) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[slot] = contact;
}

std::optional<LeaderContact> ScheduleCache::find(uint64_t slot) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(slot);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::pair<uint64_t, LeaderContact>>
ScheduleCache::range(uint64_t start, uint64_t end) const {
  std::vector<std::pair<uint64_t, LeaderContact>> result;
  if (end <= start) {
    return result;
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (auto it = entries_.lower_bound(start); it != entries_.end() && it->first < end;
       ++it) {
    result.emplace_back(it->first, it->second);
  }
  return result;
}

size_t ScheduleCache::purgeBefore(uint64_t slot) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto last = entries_.lower_bound(slot);
  size_t removed = static_cast<size_t>(std::distance(entries_.begin(), last));
  entries_.erase(entries_.begin(), last);
  return removed;
}

size_t ScheduleCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void ScheduleCache::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

std::optional<uint64_t> ScheduleCache::firstSlot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.begin()->first;
}

} // namespace tracker
} // namespace dt
