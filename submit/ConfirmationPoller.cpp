#include "ConfirmationPoller.h"

namespace dt {
namespace submit {

ConfirmationPoller::ConfirmationPoller(rpc::IRpcClient &rpc, const Config &config,
                                       Sleeper sleeper)
    : Module("submit.poller"), rpc_(rpc), config_(config),
      sleeper_(std::move(sleeper)) {}

ConfirmationPoller::ConfirmationPoller(rpc::IRpcClient &rpc)
    : ConfirmationPoller(rpc, Config{}) {}

ConfirmationPoller::Roe<void> ConfirmationPoller::confirm(const std::string &signature) {
  for (uint32_t attempt = 1; attempt <= config_.maxAttempts; ++attempt) {
    auto status = rpc_.getSignatureStatus(signature);
    if (!status) {
      log().warning << "Status query " << attempt << "/" << config_.maxAttempts
                    << " for " << signature << " failed: " << status.error().message;
    } else if (status.value()) {
      const auto &found = *status.value();
      if (found.err) {
        return Error(E_TRANSACTION_FAILED,
                     "Transaction " + signature + " failed: " + *found.err);
      }
      if (found.confirmations || found.isFinalized()) {
        log().info << "Transaction " << signature << " confirmed in slot "
                   << found.slot << " after " << attempt << " polls";
        logTransaction(signature);
        return {};
      }
      log().debug << "Transaction " << signature << " seen with status "
                  << found.confirmationStatus.value_or("unknown");
    } else {
      log().debug << "Transaction " << signature << " not visible yet ("
                  << attempt << "/" << config_.maxAttempts << ")";
    }

    if (attempt < config_.maxAttempts) {
      sleeper_(config_.interval);
    }
  }
  return Error(E_TIMEOUT, "Transaction " + signature + " not confirmed after " +
                              std::to_string(config_.maxAttempts) + " polls");
}

void ConfirmationPoller::logTransaction(const std::string &signature) {
  auto details = rpc_.getTransaction(signature);
  if (!details) {
    log().debug << "No details for " << signature << ": " << details.error().message;
    return;
  }
  log().debug << "Transaction " << signature << ": " << details.value().dump();
}

} // namespace submit
} // namespace dt
