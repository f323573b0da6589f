#include "Orchestrator.h"

namespace dt {
namespace submit {

std::string toString(LeaderPolicy policy) {
  switch (policy) {
  case LeaderPolicy::Furthest:
    return "furthest";
  case LeaderPolicy::Nearest:
    return "nearest";
  }
  return "unknown";
}

std::optional<LeaderPolicy> leaderPolicyFromString(const std::string &name) {
  if (name == "furthest") {
    return LeaderPolicy::Furthest;
  }
  if (name == "nearest") {
    return LeaderPolicy::Nearest;
  }
  return std::nullopt;
}

std::string toString(Orchestrator::State state) {
  switch (state) {
  case Orchestrator::State::SelectLeader:
    return "SelectLeader";
  case Orchestrator::State::Submit:
    return "Submit";
  case Orchestrator::State::Confirm:
    return "Confirm";
  case Orchestrator::State::Retry:
    return "Retry";
  case Orchestrator::State::Done:
    return "Done";
  case Orchestrator::State::Failed:
    return "Failed";
  }
  return "Unknown";
}

Orchestrator::Orchestrator(tracker::LeaderTracker &tracker, Submitter &submitter,
                           ConfirmationPoller &poller, const Config &config,
                           Sleeper sleeper)
    : Module("submit.orchestrator"), tracker_(tracker), submitter_(submitter),
      poller_(poller), config_(config), sleeper_(std::move(sleeper)) {}

std::optional<tracker::LeaderContact> Orchestrator::selectLeader(std::string &error) {
  auto window = tracker_.getWindow(config_.leaders, config_.offset);
  if (window.empty()) {
    error = "No leader in the window of " + std::to_string(config_.leaders) +
            " from offset " + std::to_string(config_.offset);
    return std::nullopt;
  }
  return config_.policy == LeaderPolicy::Nearest ? window.front() : window.back();
}

Orchestrator::RunResult Orchestrator::run() {
  RunResult result;
  State state = State::SelectLeader;
  tracker::LeaderContact leader;
  std::string signature;

  uint32_t maxRetry = config_.maxRetry == 0 ? 1 : config_.maxRetry;

  while (state != State::Done && state != State::Failed) {
    switch (state) {
    case State::SelectLeader: {
      std::string error;
      auto selected = selectLeader(error);
      if (!selected) {
        result.lastError = error;
        log().error << "Attempt " << result.attempts + 1 << ": " << error;
        state = State::Retry;
        break;
      }
      leader = *selected;
      state = State::Submit;
      break;
    }

    case State::Submit: {
      auto submitted = submitter_.submit(leader);
      if (!submitted) {
        result.lastError = submitted.error().message;
        log().error << "Attempt " << result.attempts + 1 << " to leader "
                    << leader.identity << " ("
                    << (leader.ingestion ? leader.ingestion->toString() : "no address")
                    << ") failed: " << result.lastError;
        state = State::Retry;
        break;
      }
      signature = submitted.value();
      state = State::Confirm;
      break;
    }

    case State::Confirm: {
      auto confirmed = poller_.confirm(signature);
      if (!confirmed) {
        result.lastError = confirmed.error().message;
        log().error << "Attempt " << result.attempts + 1 << " to leader "
                    << leader.identity << " (" << leader.ingestion->toString()
                    << ") not confirmed: " << result.lastError;
        state = State::Retry;
        break;
      }
      ++result.attempts;
      result.signature = signature;
      result.lastError.clear();
      state = State::Done;
      break;
    }

    case State::Retry:
      ++result.attempts;
      if (result.attempts >= maxRetry) {
        state = State::Failed;
        break;
      }
      log().info << "Retrying (" << result.attempts << "/" << maxRetry << ")";
      sleeper_(config_.retryDelay);
      state = State::SelectLeader;
      break;

    case State::Done:
    case State::Failed:
      break;
    }
  }

  result.state = state;
  return result;
}

} // namespace submit
} // namespace dt
