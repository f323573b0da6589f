#include "Keys.h"
#include "Utilities.h"

#include <nlohmann/json.hpp>

namespace dt {
namespace tx {

namespace {

KeyRoe<std::string> readKeypairFile(const std::string &path) {
  auto json = utl::loadJsonFile(path);
  if (!json) {
    return KeyError(E_KEY_FILE, json.error().message);
  }
  const auto &values = json.value();
  if (!values.is_array() || values.size() != Keypair::SECRET_SIZE) {
    return KeyError(E_KEY_FILE, "Keypair file must hold an array of " +
                                    std::to_string(Keypair::SECRET_SIZE) +
                                    " bytes: " + path);
  }
  std::string secret;
  secret.reserve(Keypair::SECRET_SIZE);
  for (const auto &value : values) {
    if (!value.is_number_unsigned() || value.get<uint64_t>() > 255) {
      return KeyError(E_KEY_FILE, "Keypair file holds a non-byte value: " + path);
    }
    secret.push_back(static_cast<char>(value.get<uint64_t>()));
  }
  return secret;
}

} // namespace

KeyRoe<PublicKey> PublicKey::fromBytes(const std::string &bytes) {
  if (bytes.size() != SIZE) {
    return KeyError(E_INVALID_KEY, "Public key must be " + std::to_string(SIZE) +
                                       " bytes, got " + std::to_string(bytes.size()));
  }
  return PublicKey(bytes);
}

KeyRoe<PublicKey> PublicKey::fromBase58(const std::string &text) {
  auto bytes = utl::base58Decode(text);
  if (!bytes) {
    return KeyError(E_INVALID_KEY, "Invalid public key '" + text +
                                       "': " + bytes.error().message);
  }
  return fromBytes(bytes.value());
}

KeyRoe<PublicKey> PublicKey::fromKeypairFile(const std::string &path) {
  auto keypair = Keypair::fromFile(path);
  if (!keypair) {
    return keypair.error();
  }
  return keypair.value().publicKey();
}

std::string PublicKey::toBase58() const { return utl::base58Encode(bytes_); }

KeyRoe<Keypair> Keypair::fromSeed(const std::string &seed) {
  auto pub = utl::ed25519PublicKey(seed);
  if (!pub) {
    return KeyError(E_INVALID_KEY, "Invalid seed: " + pub.error().message);
  }
  auto publicKey = PublicKey::fromBytes(pub.value());
  if (!publicKey) {
    return publicKey.error();
  }
  Keypair keypair;
  keypair.seed_ = seed;
  keypair.publicKey_ = publicKey.value();
  return keypair;
}

KeyRoe<Keypair> Keypair::fromSecretBytes(const std::string &secret) {
  if (secret.size() != SECRET_SIZE) {
    return KeyError(E_INVALID_KEY, "Secret key must be " +
                                       std::to_string(SECRET_SIZE) + " bytes, got " +
                                       std::to_string(secret.size()));
  }
  auto keypair = fromSeed(secret.substr(0, PublicKey::SIZE));
  if (!keypair) {
    return keypair.error();
  }
  if (keypair.value().publicKey().bytes() != secret.substr(PublicKey::SIZE)) {
    return KeyError(E_INVALID_KEY, "Public half of the secret key does not match its seed");
  }
  return keypair;
}

KeyRoe<Keypair> Keypair::fromBase58(const std::string &text) {
  auto bytes = utl::base58Decode(text);
  if (!bytes) {
    return KeyError(E_INVALID_KEY, "Invalid secret key: " + bytes.error().message);
  }
  return fromSecretBytes(bytes.value());
}

KeyRoe<Keypair> Keypair::fromFile(const std::string &path) {
  auto secret = readKeypairFile(path);
  if (!secret) {
    return secret.error();
  }
  return fromSecretBytes(secret.value());
}

KeyRoe<std::string> Keypair::sign(const std::string &message) const {
  if (seed_.empty()) {
    return KeyError(E_INVALID_KEY, "Keypair is empty");
  }
  auto signature = utl::ed25519Sign(seed_, message);
  if (!signature) {
    return KeyError(E_INVALID_KEY, "Signing failed: " + signature.error().message);
  }
  return signature.value();
}

} // namespace tx
} // namespace dt
