#pragma once

#include "Types.hpp"
#include "../rpc/IRpcClient.hpp"
#include "Module.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace dt {
namespace submit {

/**
 * Polls the status of one transaction until it is confirmed, fails on chain,
 * or the poll budget runs out.
 */
class ConfirmationPoller : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Config {
    uint32_t maxAttempts{ 10 };
    std::chrono::milliseconds interval{ 2000 };
  };

  static constexpr int32_t E_TIMEOUT = 1;
  static constexpr int32_t E_TRANSACTION_FAILED = 2;

  ConfirmationPoller(rpc::IRpcClient &rpc, const Config &config,
                     Sleeper sleeper = threadSleeper());
  explicit ConfirmationPoller(rpc::IRpcClient &rpc);

  Roe<void> confirm(const std::string &signature);

private:
  void logTransaction(const std::string &signature);

  rpc::IRpcClient &rpc_;
  Config config_;
  Sleeper sleeper_;
};

} // namespace submit
} // namespace dt
