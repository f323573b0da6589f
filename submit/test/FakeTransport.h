#pragma once

#include "../../network/TpuClient.h"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace dt {
namespace test {

// Records every payload; fails the next `failures` sends
class FakeTransport : public network::ITransport {
public:
  struct Sent {
    network::IpEndpoint endpoint;
    std::string payload;
    std::chrono::milliseconds timeout;
  };

  Roe<void> send(const network::IpEndpoint &endpoint, const std::string &payload,
                 std::chrono::milliseconds timeout) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sent.push_back(Sent{ endpoint, payload, timeout });
    if (failures > 0) {
      --failures;
      return Error(3, "Send timed out to " + endpoint.toString());
    }
    return {};
  }

  int failures{ 0 };
  std::vector<Sent> sent;

private:
  std::mutex mutex_;
};

} // namespace test
} // namespace dt
