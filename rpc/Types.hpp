#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dt {
namespace rpc {

// One entry of the cluster node directory (getClusterNodes)
struct ClusterNode {
  std::string pubkey;
  std::optional<std::string> gossip;
  std::optional<std::string> tpu;
  std::optional<std::string> tpuQuic;
  std::optional<std::string> tpuForwards;
  std::optional<std::string> version;
};

// Status of one signature (getSignatureStatuses)
struct SignatureStatus {
  uint64_t slot{ 0 };
  std::optional<uint64_t> confirmations; // null once rooted
  std::optional<std::string> confirmationStatus;
  std::optional<std::string> err; // compact JSON of the on-chain error

  bool isFinalized() const {
    return confirmationStatus && *confirmationStatus == "finalized";
  }
};

} // namespace rpc
} // namespace dt
