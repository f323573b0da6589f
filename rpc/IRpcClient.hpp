#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dt {
namespace rpc {

/**
 * Authoritative chain query service.
 * Implementations must be safe to call from several threads.
 */
class IRpcClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  virtual ~IRpcClient() = default;

  virtual Roe<uint64_t> getSlot() = 0;
  virtual Roe<std::vector<std::string>> getSlotLeaders(uint64_t startSlot,
                                                       uint64_t limit) = 0;
  virtual Roe<std::vector<ClusterNode>> getClusterNodes() = 0;
  /** Base58 recent blockhash */
  virtual Roe<std::string> getLatestBlockhash() = 0;
  /** std::nullopt while the signature is not visible yet */
  virtual Roe<std::optional<SignatureStatus>>
  getSignatureStatus(const std::string &signature) = 0;
  /** Full transaction details, null when unknown */
  virtual Roe<nlohmann::json> getTransaction(const std::string &signature) = 0;
};

} // namespace rpc
} // namespace dt
