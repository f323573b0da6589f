#include "Submitter.h"

namespace dt {
namespace submit {

Submitter::Submitter(rpc::IRpcClient &rpc, network::ITransport &transport,
                     const tx::Keypair &sender, const tx::TransferSpec &transfer,
                     const Config &config)
    : Module("submit.submitter"), rpc_(rpc), transport_(transport),
      sender_(sender), transfer_(transfer), config_(config) {}

Submitter::Submitter(rpc::IRpcClient &rpc, network::ITransport &transport,
                     const tx::Keypair &sender, const tx::TransferSpec &transfer)
    : Submitter(rpc, transport, sender, transfer, Config{}) {}

Submitter::Roe<std::string> Submitter::submit(const tracker::LeaderContact &leader) {
  if (!leader.ingestion) {
    return Error(E_NO_REACHABLE_LEADER,
                 "Leader " + leader.identity + " has no ingestion address");
  }
  const network::IpEndpoint &endpoint = *leader.ingestion;

  auto blockhash = rpc_.getLatestBlockhash();
  if (!blockhash) {
    return Error(E_BLOCKHASH, "Failed to get latest blockhash: " +
                                  blockhash.error().message);
  }

  auto txn = tx::TransferBuilder::build(sender_, transfer_, blockhash.value());
  if (!txn) {
    return Error(E_BUILD, "Failed to build transaction: " + txn.error().message);
  }
  std::string id = txn.value().id();
  ++submitCount_;

  log().info << "Sending " << id << " to " << leader.identity << " at " << endpoint;
  auto sent = transport_.send(endpoint, txn.value().wire, config_.sendTimeout);
  if (!sent) {
    return Error(E_SEND, "Failed to send " + id + " to " + endpoint.toString() +
                             ": " + sent.error().message);
  }
  return id;
}

} // namespace submit
} // namespace dt
