#include "SlotClock.h"

namespace dt {
namespace tracker {

bool SlotClock::advance(uint64_t newSlot) {
  uint64_t current = slot_.load(std::memory_order_acquire);
  while (newSlot > current) {
    if (slot_.compare_exchange_weak(current, newSlot, std::memory_order_acq_rel,
                                    std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

} // namespace tracker
} // namespace dt
