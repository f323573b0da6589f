#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <msquic.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dt {
namespace network {

/**
 * QuicConnection - one client connection to a leader's TPU QUIC port.
 *
 * Every payload travels on its own unidirectional stream that is finished
 * right after the data. Callbacks arrive on QUIC worker threads; the object
 * must stay at a fixed address while the connection handle is open, so it is
 * neither copyable nor movable.
 */
class QuicConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_OPEN = 1;
  static constexpr int32_t E_HANDSHAKE = 2;
  static constexpr int32_t E_CLOSED = 3;
  static constexpr int32_t E_STREAM = 4;
  static constexpr int32_t E_TIMEOUT = 5;

  QuicConnection(const QUIC_API_TABLE *api, const IpEndpoint &peer);
  ~QuicConnection();

  QuicConnection(const QuicConnection &) = delete;
  QuicConnection &operator=(const QuicConnection &) = delete;

  /** Start the handshake and wait for it to finish */
  Roe<void> connect(HQUIC registration, HQUIC configuration,
                    std::chrono::milliseconds timeout);

  /**
   * Write payload on a new stream and wait until the peer acknowledged all of
   * it. A timeout shuts the whole connection down.
   */
  Roe<void> send(const std::string &payload, std::chrono::milliseconds timeout);

  bool isConnected() const;
  const IpEndpoint &getPeer() const { return peer_; }

  /** Close the handle; blocks until the library released it */
  void close();

private:
  struct Stream {
    QuicConnection *owner{ nullptr };
    std::string payload;
    QUIC_BUFFER buffer{};
    bool finished{ false };
    bool delivered{ false };
  };

  static QUIC_STATUS QUIC_API onConnectionEvent(HQUIC connection, void *context,
                                                QUIC_CONNECTION_EVENT *event);
  static QUIC_STATUS QUIC_API onStreamEvent(HQUIC stream, void *context,
                                            QUIC_STREAM_EVENT *event);

  void forget(Stream *stream);
  void shutdown();

  const QUIC_API_TABLE *api_;
  IpEndpoint peer_;
  HQUIC connection_{ nullptr };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool connected_{ false };
  bool closed_{ false };
  std::string closeReason_;
  // Streams stay alive until the library reports their shutdown
  std::map<Stream *, std::shared_ptr<Stream>> streams_;
};

/** Hex rendering of a QUIC status code for log and error messages */
std::string quicStatusToString(QUIC_STATUS status);

} // namespace network
} // namespace dt
