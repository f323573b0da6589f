#pragma once

#include "Module.h"
#include "QuicConnection.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <msquic.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dt {
namespace network {

/**
 * Delivery of an opaque serialized transaction to a leader's ingestion endpoint.
 */
class ITransport {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  virtual ~ITransport() = default;

  virtual Roe<void> send(const IpEndpoint &endpoint, const std::string &payload,
                         std::chrono::milliseconds timeout) = 0;
};

/**
 * TpuClient - sends transactions to leader TPU QUIC ports.
 *
 * One QUIC connection is kept per leader endpoint and reused by later sends;
 * it is opened lazily on the first send to that endpoint, and the QUIC
 * library itself is loaded on the first send at all. Each transaction goes on
 * its own unidirectional stream. A failed send drops the cached connection
 * so the next attempt starts from a fresh handshake.
 */
class TpuClient : public ITransport, public Module {
public:
  // Largest serialized transaction a leader accepts
  static constexpr size_t MAX_PACKET_SIZE = 1232;

  static constexpr int32_t E_PAYLOAD = 1;
  static constexpr int32_t E_CONNECT = 2;
  static constexpr int32_t E_SEND = 3;

  struct Config {
    std::string alpn{ "solana-tpu" };
    std::chrono::milliseconds handshakeTimeout{ 10000 };
    std::chrono::milliseconds idleTimeout{ 30000 };
    std::chrono::milliseconds keepAliveInterval{ 1000 };
    // 32-byte Ed25519 seed of the certificate identity; empty picks a random one
    std::string identitySeed;
  };

  explicit TpuClient(const Config &config);
  TpuClient();
  ~TpuClient() override;

  TpuClient(const TpuClient &) = delete;
  TpuClient &operator=(const TpuClient &) = delete;

  Roe<void> send(const IpEndpoint &endpoint, const std::string &payload,
                 std::chrono::milliseconds timeout) override;

  size_t getConnectionCount() const;
  void closeAll();

private:
  // Caller holds mutex_
  Roe<void> openLibrary();
  void closeLibrary();

  Config config_;
  mutable std::mutex mutex_;
  const QUIC_API_TABLE *api_{ nullptr };
  HQUIC registration_{ nullptr };
  HQUIC configuration_{ nullptr };
  std::map<IpEndpoint, std::unique_ptr<QuicConnection>> connections_;
};

} // namespace network
} // namespace dt
