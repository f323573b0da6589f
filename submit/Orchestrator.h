#pragma once

#include "ConfirmationPoller.h"
#include "Submitter.h"
#include "Types.hpp"
#include "../tracker/LeaderTracker.h"
#include "Module.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dt {
namespace submit {

enum class LeaderPolicy {
  Furthest, // last leader of the window
  Nearest,  // first leader of the window
};

std::string toString(LeaderPolicy policy);
std::optional<LeaderPolicy> leaderPolicyFromString(const std::string &name);

/**
 * Orchestrator - drives select leader -> submit -> confirm, retrying with a
 * new leader and a new transaction until confirmed or out of attempts.
 */
class Orchestrator : public Module {
public:
  enum class State { SelectLeader, Submit, Confirm, Retry, Done, Failed };

  struct Config {
    uint32_t maxRetry{ 1 };      // total attempts
    size_t leaders{ 4 };         // window size
    int64_t offset{ 0 };         // window start relative to the current slot
    LeaderPolicy policy{ LeaderPolicy::Furthest };
    std::chrono::milliseconds retryDelay{ 1000 };
  };

  struct RunResult {
    State state{ State::Failed };
    uint32_t attempts{ 0 };
    std::string signature; // confirmed transaction, empty on failure
    std::string lastError;

    bool isDone() const { return state == State::Done; }
  };

  static constexpr int32_t E_NO_REACHABLE_LEADER = 1;

  Orchestrator(tracker::LeaderTracker &tracker, Submitter &submitter,
               ConfirmationPoller &poller, const Config &config,
               Sleeper sleeper = threadSleeper());

  RunResult run();

private:
  std::optional<tracker::LeaderContact> selectLeader(std::string &error);

  tracker::LeaderTracker &tracker_;
  Submitter &submitter_;
  ConfirmationPoller &poller_;
  Config config_;
  Sleeper sleeper_;
};

std::string toString(Orchestrator::State state);

} // namespace submit
} // namespace dt
