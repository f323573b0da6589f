#pragma once

#include "ResultOrError.hpp"

#include <cstddef>
#include <string>

namespace dt {
namespace tx {

struct KeyError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using KeyRoe = ResultOrError<T, KeyError>;

static constexpr int32_t E_INVALID_KEY = 1;
static constexpr int32_t E_KEY_FILE = 2;

/** 32-byte Ed25519 public key, shown in base58 */
class PublicKey {
public:
  static constexpr size_t SIZE = 32;

  PublicKey() = default;

  static KeyRoe<PublicKey> fromBytes(const std::string &bytes);
  static KeyRoe<PublicKey> fromBase58(const std::string &text);
  /** Public half of a JSON keypair file */
  static KeyRoe<PublicKey> fromKeypairFile(const std::string &path);

  const std::string &bytes() const { return bytes_; }
  std::string toBase58() const;

  bool operator==(const PublicKey &other) const { return bytes_ == other.bytes_; }
  bool operator!=(const PublicKey &other) const { return bytes_ != other.bytes_; }

private:
  explicit PublicKey(const std::string &bytes) : bytes_(bytes) {}

  std::string bytes_;
};

/**
 * Ed25519 signing key: a 32-byte seed plus its public key (the usual 64-byte
 * secret key layout). Loaded from a base58 string or a JSON array file.
 */
class Keypair {
public:
  static constexpr size_t SECRET_SIZE = 64;
  static constexpr size_t SIGNATURE_SIZE = 64;

  Keypair() = default;

  static KeyRoe<Keypair> fromSecretBytes(const std::string &secret);
  static KeyRoe<Keypair> fromBase58(const std::string &text);
  static KeyRoe<Keypair> fromSeed(const std::string &seed);
  /** File holding a JSON array of 64 integers */
  static KeyRoe<Keypair> fromFile(const std::string &path);

  const PublicKey &publicKey() const { return publicKey_; }

  /** 64-byte detached signature over message */
  KeyRoe<std::string> sign(const std::string &message) const;

private:
  std::string seed_;
  PublicKey publicKey_;
};

} // namespace tx
} // namespace dt
