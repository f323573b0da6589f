#pragma once

#include "ResultOrError.hpp"

#include <string>

namespace dt {
namespace network {

/**
 * QuicIdentity - self-signed Ed25519 certificate presented by the client
 * during the QUIC handshake.
 *
 * Leaders read the peer identity from the certificate public key. The
 * certificate and key are kept as one password-less PKCS#12 bundle, the form
 * the QUIC library loads client credentials from.
 */
class QuicIdentity {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_KEY = 1;
  static constexpr int32_t E_CERTIFICATE = 2;
  static constexpr int32_t E_ENCODE = 3;

  /** Identity for a 32-byte Ed25519 seed */
  static Roe<QuicIdentity> fromSeed(const std::string &seed);

  /** Identity for a fresh random key */
  static Roe<QuicIdentity> generate();

  /** DER-encoded PKCS#12 holding the certificate and private key */
  const std::string &getPkcs12() const { return pkcs12_; }

  /** Raw 32-byte Ed25519 public key carried by the certificate */
  const std::string &getPublicKey() const { return publicKey_; }

private:
  QuicIdentity() = default;

  std::string pkcs12_;
  std::string publicKey_;
};

} // namespace network
} // namespace dt
