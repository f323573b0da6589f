#include "SlotFeed.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

namespace dt {
namespace rpc {

namespace {

const char *const SUBSCRIBE_REQUEST =
    R"({"jsonrpc":"2.0","id":1,"method":"slotSubscribe"})";

} // namespace

SlotFeed::SlotFeed(const Config &config, SlotCallback onSlot)
    : Service("rpc.slot_feed"), config_(config), onSlot_(std::move(onSlot)) {}

SlotFeed::~SlotFeed() { stop(); }

std::string SlotFeed::normalizeUrl(const std::string &url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return url;
  }
  auto pathStart = url.find_first_of("/?", schemeEnd + 3);
  if (pathStart == std::string::npos) {
    return url + "/";
  }
  if (url[pathStart] == '?') {
    return url.substr(0, pathStart) + "/" + url.substr(pathStart);
  }
  return url;
}

std::optional<uint64_t> SlotFeed::parseSlotNotification(const std::string &text) {
  auto message = nlohmann::json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return std::nullopt;
  }
  if (message.value("method", "") != "slotNotification") {
    return std::nullopt;
  }
  auto params = message.find("params");
  if (params == message.end() || !params->is_object()) {
    return std::nullopt;
  }
  auto result = params->find("result");
  if (result == params->end() || !result->is_object()) {
    return std::nullopt;
  }
  auto slot = result->find("slot");
  if (slot == result->end() || !slot->is_number_unsigned()) {
    return std::nullopt;
  }
  return slot->get<uint64_t>();
}

void SlotFeed::runLoop() {
  while (runSession()) {
    if (!waitFor(config_.reconnectDelay)) {
      break;
    }
    log().info << "Reconnecting slot feed to " << config_.url;
  }
}

bool SlotFeed::runSession() {
  std::unique_ptr<httplib::ws::WebSocketClient> client;
  try {
    client = std::make_unique<httplib::ws::WebSocketClient>(normalizeUrl(config_.url));
  } catch (const std::invalid_argument &e) {
    log().error << "Slot feed disabled: " << e.what();
    return false;
  }
  if (!client->is_valid()) {
    log().error << "Slot feed disabled: invalid url " << config_.url;
    return false;
  }
  client->set_read_timeout(static_cast<time_t>(config_.readTimeout.count()), 0);
  client->set_write_timeout(10, 0);

  if (!client->connect()) {
    log().error << "Failed to connect slot feed to " << config_.url
                << ", continuing with polled slots only";
    return false;
  }
  if (!client->send(SUBSCRIBE_REQUEST)) {
    log().error << "Failed to send slot subscription, continuing with polled slots only";
    client->close();
    return false;
  }
  ++sessionCount_;
  log().info << "Subscribed to slot updates at " << config_.url;

  std::string message;
  while (!isStopSet()) {
    auto kind = client->read(message);
    if (kind == httplib::ws::ReadResult::Fail) {
      // A read timeout closes the stream too
      if (isStopSet()) {
        return false;
      }
      log().warning << "Slot feed interrupted after " << notificationCount_.load()
                    << " notifications";
      return true;
    }
    if (kind != httplib::ws::ReadResult::Text) {
      continue;
    }
    auto slot = parseSlotNotification(message);
    if (!slot) {
      log().debug << "Ignoring feed message: " << message;
      continue;
    }
    ++notificationCount_;
    onSlot_(*slot);
  }

  if (client->is_open()) {
    client->close();
  }
  return false;
}

} // namespace rpc
} // namespace dt
