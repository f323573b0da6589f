#pragma once

#include "Keys.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <string>

namespace dt {
namespace tx {

struct TransferSpec {
  PublicKey receiver;
  uint64_t lamports{ 1000 };
  uint32_t computeUnitLimit{ 50000 };
  uint64_t computeUnitPrice{ 10000 }; // micro-lamports per compute unit
};

struct SignedTransaction {
  std::string message;   // serialized message, the signed bytes
  std::string signature; // 64 raw bytes
  std::string wire;      // signatures section followed by the message

  /** Transaction identifier */
  std::string id() const;
};

/**
 * Builds single-signer legacy transfer transactions with compute budget
 * instructions in front of the system transfer.
 */
class TransferBuilder {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_BLOCKHASH = 1;
  static constexpr int32_t E_SIGN = 2;

  static const char *const SYSTEM_PROGRAM_ID;
  static const char *const COMPUTE_BUDGET_PROGRAM_ID;

  static Roe<SignedTransaction> build(const Keypair &sender, const TransferSpec &spec,
                                      const std::string &recentBlockhash);

  /** Unsigned message bytes */
  static Roe<std::string> buildMessage(const PublicKey &sender, const TransferSpec &spec,
                                       const std::string &recentBlockhash);
};

} // namespace tx
} // namespace dt
