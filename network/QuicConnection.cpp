#include "QuicConnection.h"

#include <iomanip>
#include <sstream>

namespace dt {
namespace network {

std::string quicStatusToString(QUIC_STATUS status) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(8) << std::setfill('0')
      << static_cast<uint64_t>(status);
  return oss.str();
}

QuicConnection::QuicConnection(const QUIC_API_TABLE *api, const IpEndpoint &peer)
    : api_(api), peer_(peer) {}

QuicConnection::~QuicConnection() { close(); }

QuicConnection::Roe<void> QuicConnection::connect(HQUIC registration,
                                                  HQUIC configuration,
                                                  std::chrono::milliseconds timeout) {
  if (connection_ != nullptr) {
    return Error(E_OPEN, "Connection to " + peer_.toString() + " already started");
  }

  QUIC_STATUS status =
      api_->ConnectionOpen(registration, &QuicConnection::onConnectionEvent, this,
                           &connection_);
  if (QUIC_FAILED(status)) {
    connection_ = nullptr;
    return Error(E_OPEN, "ConnectionOpen failed: " + quicStatusToString(status));
  }

  status = api_->ConnectionStart(connection_, configuration, QUIC_ADDRESS_FAMILY_UNSPEC,
                                 peer_.address.c_str(), peer_.port);
  if (QUIC_FAILED(status)) {
    close();
    return Error(E_OPEN, "ConnectionStart to " + peer_.toString() +
                             " failed: " + quicStatusToString(status));
  }

  bool connected = false;
  std::string reason;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return connected_ || closed_; });
    connected = connected_;
    reason = closed_ ? closeReason_ : "handshake timed out";
  }
  if (!connected) {
    close();
    return Error(E_HANDSHAKE, "QUIC handshake with " + peer_.toString() +
                                  " failed: " + reason);
  }
  return {};
}

QuicConnection::Roe<void> QuicConnection::send(const std::string &payload,
                                               std::chrono::milliseconds timeout) {
  auto stream = std::make_shared<Stream>();
  stream->owner = this;
  stream->payload = payload;
  stream->buffer.Length = static_cast<uint32_t>(stream->payload.size());
  stream->buffer.Buffer = reinterpret_cast<uint8_t *>(stream->payload.data());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || connection_ == nullptr) {
      return Error(E_CLOSED, "Connection to " + peer_.toString() + " is closed" +
                                 (closeReason_.empty() ? "" : ": " + closeReason_));
    }
    streams_[stream.get()] = stream;
  }

  // No lock across library calls; events may be delivered inline
  HQUIC handle = nullptr;
  QUIC_STATUS status =
      api_->StreamOpen(connection_, QUIC_STREAM_OPEN_FLAG_UNIDIRECTIONAL,
                       &QuicConnection::onStreamEvent, stream.get(), &handle);
  if (QUIC_FAILED(status)) {
    forget(stream.get());
    return Error(E_STREAM, "StreamOpen failed: " + quicStatusToString(status));
  }

  status = api_->StreamStart(handle, QUIC_STREAM_START_FLAG_NONE);
  if (QUIC_FAILED(status)) {
    api_->StreamClose(handle);
    forget(stream.get());
    return Error(E_STREAM, "StreamStart failed: " + quicStatusToString(status));
  }

  status = api_->StreamSend(handle, &stream->buffer, 1, QUIC_SEND_FLAG_FIN, nullptr);
  if (QUIC_FAILED(status)) {
    // The started stream goes away with the connection
    shutdown();
    return Error(E_STREAM, "StreamSend failed: " + quicStatusToString(status));
  }

  bool finished = false;
  bool delivered = false;
  std::string reason;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return stream->finished || closed_; });
    finished = stream->finished;
    delivered = stream->delivered;
    reason = closeReason_;
  }

  if (!finished) {
    shutdown();
    if (!reason.empty()) {
      return Error(E_CLOSED, "Connection to " + peer_.toString() + " closed: " + reason);
    }
    return Error(E_TIMEOUT, "Send to " + peer_.toString() + " timed out after " +
                                std::to_string(timeout.count()) + " ms");
  }
  if (!delivered) {
    return Error(E_STREAM, "Stream to " + peer_.toString() + " was aborted");
  }
  return {};
}

bool QuicConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_ && !closed_;
}

void QuicConnection::shutdown() {
  if (connection_ != nullptr) {
    api_->ConnectionShutdown(connection_, QUIC_CONNECTION_SHUTDOWN_FLAG_NONE, 0);
  }
}

void QuicConnection::close() {
  if (connection_ == nullptr) {
    return;
  }
  api_->ConnectionClose(connection_);
  connection_ = nullptr;

  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = false;
  closed_ = true;
  if (closeReason_.empty()) {
    closeReason_ = "closed locally";
  }
  streams_.clear();
  cv_.notify_all();
}

void QuicConnection::forget(Stream *stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  streams_.erase(stream);
}

QUIC_STATUS QUIC_API QuicConnection::onConnectionEvent(HQUIC, void *context,
                                                       QUIC_CONNECTION_EVENT *event) {
  auto *self = static_cast<QuicConnection *>(context);
  std::lock_guard<std::mutex> lock(self->mutex_);
  switch (event->Type) {
  case QUIC_CONNECTION_EVENT_CONNECTED:
    self->connected_ = true;
    break;
  case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_TRANSPORT:
    if (self->closeReason_.empty()) {
      self->closeReason_ =
          "transport status " + quicStatusToString(event->SHUTDOWN_INITIATED_BY_TRANSPORT.Status);
    }
    break;
  case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_PEER:
    if (self->closeReason_.empty()) {
      self->closeReason_ = "peer error code " +
                           std::to_string(event->SHUTDOWN_INITIATED_BY_PEER.ErrorCode);
    }
    break;
  case QUIC_CONNECTION_EVENT_SHUTDOWN_COMPLETE:
    self->connected_ = false;
    self->closed_ = true;
    if (self->closeReason_.empty()) {
      self->closeReason_ = "connection shut down";
    }
    break;
  default:
    return QUIC_STATUS_SUCCESS;
  }
  self->cv_.notify_all();
  return QUIC_STATUS_SUCCESS;
}

QUIC_STATUS QUIC_API QuicConnection::onStreamEvent(HQUIC handle, void *context,
                                                   QUIC_STREAM_EVENT *event) {
  auto *stream = static_cast<Stream *>(context);
  QuicConnection *self = stream->owner;

  switch (event->Type) {
  case QUIC_STREAM_EVENT_SEND_SHUTDOWN_COMPLETE: {
    // Graceful once the peer acknowledged everything up to the FIN
    std::lock_guard<std::mutex> lock(self->mutex_);
    stream->delivered = event->SEND_SHUTDOWN_COMPLETE.Graceful != FALSE;
    stream->finished = true;
    self->cv_.notify_all();
    break;
  }
  case QUIC_STREAM_EVENT_SHUTDOWN_COMPLETE: {
    bool appClosing = event->SHUTDOWN_COMPLETE.AppCloseInProgress != FALSE;
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      stream->finished = true;
      self->cv_.notify_all();
    }
    if (!appClosing) {
      self->api_->StreamClose(handle);
    }
    // Last event for this stream
    self->forget(stream);
    break;
  }
  default:
    break;
  }
  return QUIC_STATUS_SUCCESS;
}

} // namespace network
} // namespace dt
