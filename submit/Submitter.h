#pragma once

#include "../network/TpuClient.h"
#include "../rpc/IRpcClient.hpp"
#include "../tracker/ScheduleCache.h"
#include "../tx/TransferBuilder.h"
#include "Module.h"

#include <chrono>
#include <string>

namespace dt {
namespace submit {

/**
 * Submitter - signs one transfer against a fresh blockhash and sends it
 * straight to a leader's ingestion address.
 *
 * Every call builds a new transaction, so two submissions of the same
 * transfer carry different identifiers. Nothing is retried here.
 */
class Submitter : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Config {
    std::chrono::milliseconds sendTimeout{ 60000 };
  };

  static constexpr int32_t E_NO_REACHABLE_LEADER = 1;
  static constexpr int32_t E_BLOCKHASH = 2;
  static constexpr int32_t E_BUILD = 3;
  static constexpr int32_t E_SEND = 4;

  Submitter(rpc::IRpcClient &rpc, network::ITransport &transport,
            const tx::Keypair &sender, const tx::TransferSpec &transfer,
            const Config &config);
  Submitter(rpc::IRpcClient &rpc, network::ITransport &transport,
            const tx::Keypair &sender, const tx::TransferSpec &transfer);

  /** @return identifier of the transaction handed to the leader */
  Roe<std::string> submit(const tracker::LeaderContact &leader);

  uint64_t getSubmitCount() const { return submitCount_; }

private:
  rpc::IRpcClient &rpc_;
  network::ITransport &transport_;
  tx::Keypair sender_;
  tx::TransferSpec transfer_;
  Config config_;
  uint64_t submitCount_{ 0 };
};

} // namespace submit
} // namespace dt
