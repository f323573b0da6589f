#pragma once

#include "Service.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace dt {
namespace rpc {

/**
 * SlotFeed - streaming slot subscription over WebSocket (slotSubscribe).
 *
 * Each notification is handed to the slot callback. A subscribed stream that
 * drops or goes silent is reconnected. A failed connect or subscribe ends the
 * feed; callers keep working from the periodic authoritative slot query in
 * that case. The WebSocket client is only ever touched by the feed thread, so
 * stop() takes effect at the next read timeout.
 */
class SlotFeed : public Service {
public:
  using SlotCallback = std::function<void(uint64_t slot)>;

  struct Config {
    std::string url; // ws://host[:port][/path] or wss://...
    // Slots arrive every few hundred milliseconds; silence this long reconnects
    std::chrono::seconds readTimeout{ 1 };
    std::chrono::milliseconds reconnectDelay{ 1000 };
  };

  SlotFeed(const Config &config, SlotCallback onSlot);
  ~SlotFeed() override;

  /** Slot of a slotNotification message, std::nullopt for anything else */
  static std::optional<uint64_t> parseSlotNotification(const std::string &text);

  /** Append "/" when the url has no path; the WebSocket client requires one */
  static std::string normalizeUrl(const std::string &url);

  uint64_t getNotificationCount() const { return notificationCount_; }
  /** Sessions that got as far as a subscription */
  uint64_t getSessionCount() const { return sessionCount_; }

protected:
  void runLoop() override;

private:
  /** One connect-subscribe-read cycle; true when the stream should be reopened */
  bool runSession();

  Config config_;
  SlotCallback onSlot_;
  std::atomic<uint64_t> notificationCount_{ 0 };
  std::atomic<uint64_t> sessionCount_{ 0 };
};

} // namespace rpc
} // namespace dt
