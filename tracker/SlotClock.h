#pragma once

#include <atomic>
#include <cstdint>

namespace dt {
namespace tracker {

/**
 * Latest known slot. Only moves forward: an update that is not newer than
 * the current value is ignored, whichever thread delivers it.
 */
class SlotClock {
public:
  SlotClock() = default;
  explicit SlotClock(uint64_t initialSlot) : slot_(initialSlot) {}

  /** @return true if the clock moved to newSlot */
  bool advance(uint64_t newSlot);

  uint64_t read() const { return slot_.load(std::memory_order_acquire); }

private:
  std::atomic<uint64_t> slot_{ 0 };
};

} // namespace tracker
} // namespace dt
