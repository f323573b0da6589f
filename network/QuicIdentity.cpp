#include "QuicIdentity.h"

#include "Utilities.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <memory>

namespace dt {
namespace network {

namespace {

constexpr size_t SEED_SIZE = 32;
constexpr long VALIDITY_SECONDS = 10L * 365 * 24 * 60 * 60;
const char *const COMMON_NAME = "Solana node";

using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using Pkcs12Ptr = std::unique_ptr<PKCS12, decltype(&PKCS12_free)>;

std::string lastSslError() {
  char buffer[256];
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return buffer;
}

} // namespace

QuicIdentity::Roe<QuicIdentity> QuicIdentity::generate() {
  return fromSeed(utl::randomBytes(SEED_SIZE));
}

QuicIdentity::Roe<QuicIdentity> QuicIdentity::fromSeed(const std::string &seed) {
  if (seed.size() != SEED_SIZE) {
    return Error(E_KEY, "Identity seed must be 32 bytes, got " +
                            std::to_string(seed.size()));
  }

  PKeyPtr key(EVP_PKEY_new_raw_private_key(
                  EVP_PKEY_ED25519, nullptr,
                  reinterpret_cast<const unsigned char *>(seed.data()), seed.size()),
              &EVP_PKEY_free);
  if (!key) {
    return Error(E_KEY, "Failed to load Ed25519 key: " + lastSslError());
  }

  QuicIdentity identity;
  identity.publicKey_.resize(SEED_SIZE);
  size_t publicKeySize = identity.publicKey_.size();
  if (EVP_PKEY_get_raw_public_key(
          key.get(), reinterpret_cast<unsigned char *>(identity.publicKey_.data()),
          &publicKeySize) != 1) {
    return Error(E_KEY, "Failed to derive public key: " + lastSslError());
  }

  X509Ptr cert(X509_new(), &X509_free);
  if (!cert) {
    return Error(E_CERTIFICATE, "Failed to allocate certificate");
  }
  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), VALIDITY_SECONDS);

  X509_NAME *name = X509_get_subject_name(cert.get());
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char *>(COMMON_NAME), -1,
                             -1, 0);
  if (X509_set_issuer_name(cert.get(), name) != 1 ||
      X509_set_pubkey(cert.get(), key.get()) != 1) {
    return Error(E_CERTIFICATE, "Failed to fill certificate: " + lastSslError());
  }
  // Ed25519 signs without a separate digest
  if (X509_sign(cert.get(), key.get(), nullptr) <= 0) {
    return Error(E_CERTIFICATE, "Failed to sign certificate: " + lastSslError());
  }

  Pkcs12Ptr bundle(PKCS12_create("", nullptr, key.get(), cert.get(), nullptr, 0, 0, 0,
                                 0, 0),
                   &PKCS12_free);
  if (!bundle) {
    return Error(E_ENCODE, "Failed to build PKCS#12 bundle: " + lastSslError());
  }
  int length = i2d_PKCS12(bundle.get(), nullptr);
  if (length <= 0) {
    return Error(E_ENCODE, "Failed to encode PKCS#12 bundle: " + lastSslError());
  }
  identity.pkcs12_.resize(static_cast<size_t>(length));
  auto *out = reinterpret_cast<unsigned char *>(identity.pkcs12_.data());
  i2d_PKCS12(bundle.get(), &out);

  return identity;
}

} // namespace network
} // namespace dt
