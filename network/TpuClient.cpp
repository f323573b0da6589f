#include "TpuClient.h"

#include "QuicIdentity.h"
#include "Utilities.h"

#include <algorithm>

namespace dt {
namespace network {

TpuClient::TpuClient(const Config &config)
    : Module("network.tpu_client"), config_(config) {}

TpuClient::TpuClient() : TpuClient(Config{}) {}

TpuClient::~TpuClient() {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.clear();
  closeLibrary();
}

TpuClient::Roe<void> TpuClient::openLibrary() {
  if (configuration_ != nullptr) {
    return {};
  }

  auto identity = config_.identitySeed.empty()
                      ? QuicIdentity::generate()
                      : QuicIdentity::fromSeed(config_.identitySeed);
  if (!identity) {
    return Error(E_CONNECT, "Client identity: " + identity.error().message);
  }

  QUIC_STATUS status = MsQuicOpen2(&api_);
  if (QUIC_FAILED(status)) {
    api_ = nullptr;
    return Error(E_CONNECT, "MsQuicOpen2 failed: " + quicStatusToString(status));
  }

  const QUIC_REGISTRATION_CONFIG registrationConfig = {
    "direct-tpu", QUIC_EXECUTION_PROFILE_LOW_LATENCY
  };
  status = api_->RegistrationOpen(&registrationConfig, &registration_);
  if (QUIC_FAILED(status)) {
    registration_ = nullptr;
    closeLibrary();
    return Error(E_CONNECT, "RegistrationOpen failed: " + quicStatusToString(status));
  }

  QUIC_SETTINGS settings{};
  settings.IdleTimeoutMs = static_cast<uint64_t>(config_.idleTimeout.count());
  settings.IsSet.IdleTimeoutMs = TRUE;
  settings.HandshakeIdleTimeoutMs = static_cast<uint64_t>(config_.handshakeTimeout.count());
  settings.IsSet.HandshakeIdleTimeoutMs = TRUE;
  settings.KeepAliveIntervalMs = static_cast<uint32_t>(config_.keepAliveInterval.count());
  settings.IsSet.KeepAliveIntervalMs = TRUE;

  QUIC_BUFFER alpn;
  alpn.Length = static_cast<uint32_t>(config_.alpn.size());
  alpn.Buffer = reinterpret_cast<uint8_t *>(config_.alpn.data());

  status = api_->ConfigurationOpen(registration_, &alpn, 1, &settings, sizeof(settings),
                                   nullptr, &configuration_);
  if (QUIC_FAILED(status)) {
    configuration_ = nullptr;
    closeLibrary();
    return Error(E_CONNECT, "ConfigurationOpen failed: " + quicStatusToString(status));
  }

  // Leaders present self-signed certificates; only the client side is checked
  QUIC_CERTIFICATE_PKCS12 pkcs12{};
  pkcs12.Asn1Blob = reinterpret_cast<const uint8_t *>(identity->getPkcs12().data());
  pkcs12.Asn1BlobLength = static_cast<uint32_t>(identity->getPkcs12().size());
  pkcs12.PrivateKeyPassword = "";

  QUIC_CREDENTIAL_CONFIG credential{};
  credential.Type = QUIC_CREDENTIAL_TYPE_CERTIFICATE_PKCS12;
  credential.Flags = static_cast<QUIC_CREDENTIAL_FLAGS>(
      QUIC_CREDENTIAL_FLAG_CLIENT | QUIC_CREDENTIAL_FLAG_NO_CERTIFICATE_VALIDATION);
  credential.CertificatePkcs12 = &pkcs12;

  status = api_->ConfigurationLoadCredential(configuration_, &credential);
  if (QUIC_FAILED(status)) {
    closeLibrary();
    return Error(E_CONNECT, "Loading client certificate failed: " +
                                quicStatusToString(status));
  }

  log().debug << "QUIC client ready, identity "
              << utl::base58Encode(identity->getPublicKey());
  return {};
}

void TpuClient::closeLibrary() {
  if (api_ == nullptr) {
    return;
  }
  if (configuration_ != nullptr) {
    api_->ConfigurationClose(configuration_);
    configuration_ = nullptr;
  }
  if (registration_ != nullptr) {
    // Blocks until every connection of the registration is closed
    api_->RegistrationClose(registration_);
    registration_ = nullptr;
  }
  MsQuicClose(api_);
  api_ = nullptr;
}

TpuClient::Roe<void> TpuClient::send(const IpEndpoint &endpoint,
                                     const std::string &payload,
                                     std::chrono::milliseconds timeout) {
  if (payload.empty() || payload.size() > MAX_PACKET_SIZE) {
    return Error(E_PAYLOAD, "Payload size " + std::to_string(payload.size()) +
                                " outside 1.." + std::to_string(MAX_PACKET_SIZE));
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto opened = openLibrary();
  if (!opened) {
    return opened;
  }

  auto it = connections_.find(endpoint);
  if (it != connections_.end() && !it->second->isConnected()) {
    log().debug << "Dropping closed connection to " << endpoint;
    connections_.erase(it);
    it = connections_.end();
  }

  if (it == connections_.end()) {
    auto connection = std::make_unique<QuicConnection>(api_, endpoint);
    auto connected = connection->connect(registration_, configuration_,
                                         std::min(timeout, config_.handshakeTimeout));
    if (!connected) {
      return Error(E_CONNECT, connected.error().message);
    }
    log().debug << "Opened QUIC connection to " << endpoint;
    it = connections_.emplace(endpoint, std::move(connection)).first;
  }

  auto sent = it->second->send(payload, timeout);
  if (!sent) {
    log().warning << "Send to " << endpoint << " failed: " << sent.error().message;
    connections_.erase(it);
    return Error(E_SEND, sent.error().message);
  }

  log().debug << "Sent " << payload.size() << " bytes to " << endpoint;
  return {};
}

size_t TpuClient::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void TpuClient::closeAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.clear();
}

} // namespace network
} // namespace dt
