#include "Utilities.h"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace dt {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
  struct SodiumInitializer {
    SodiumInitializer() {
      if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
      }
    }
  };
  static SodiumInitializer sodium_initializer;

  constexpr size_t ED25519_SEED_SIZE = 32;
  constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
  constexpr size_t ED25519_SIGNATURE_SIZE = 64;

  const char BASE58_ALPHABET[] =
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size() && !str.empty();
}

bool parsePort(const std::string &str, uint16_t &port) {
  uint64_t value = 0;
  if (!parseUInt64(str, value)) {
    return false;
  }
  if (value == 0 || value > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port) {
  size_t colonPos = hostPort.find_last_of(':');
  if (colonPos == std::string::npos || colonPos == 0 ||
      colonPos == hostPort.length() - 1) {
    return false;
  }

  host = hostPort.substr(0, colonPos);
  return parsePort(hostPort.substr(colonPos + 1), port);
}

std::string join(const std::vector<std::string> &strings, const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0) {
      result += delimiter;
    }
    result += strings[i];
  }
  return result;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  auto content = readFile(path);
  if (!content) {
    return Error(2, content.error().message);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content.value());
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + std::string(e.what()));
  }

  return json;
}

std::string base58Encode(const std::string &data) {
  size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == '\0') {
    ++zeros;
  }

  // Base-256 to base-58, most significant digit first
  std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
  size_t length = 0;
  for (size_t i = zeros; i < data.size(); ++i) {
    uint32_t carry = static_cast<uint8_t>(data[i]);
    size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
         ++it, ++j) {
      carry += 256u * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != digits.end() && *it == 0) {
    ++it;
  }
  std::string result(zeros, '1');
  for (; it != digits.end(); ++it) {
    result.push_back(BASE58_ALPHABET[*it]);
  }
  return result;
}

Roe<std::string> base58Decode(const std::string &text) {
  size_t zeros = 0;
  while (zeros < text.size() && text[zeros] == '1') {
    ++zeros;
  }

  std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
  size_t length = 0;
  for (size_t i = zeros; i < text.size(); ++i) {
    const char *pos = std::strchr(BASE58_ALPHABET, text[i]);
    if (pos == nullptr || text[i] == '\0') {
      return Error(1, "Invalid base58 character at position " + std::to_string(i));
    }
    uint32_t carry = static_cast<uint32_t>(pos - BASE58_ALPHABET);
    size_t j = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend();
         ++it, ++j) {
      carry += 58u * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
  while (it != bytes.end() && *it == 0) {
    ++it;
  }
  std::string result(zeros, '\0');
  for (; it != bytes.end(); ++it) {
    result.push_back(static_cast<char>(*it));
  }
  return result;
}

// --- Ed25519

Roe<std::string> ed25519PublicKey(const std::string &seed) {
  if (seed.size() != ED25519_SEED_SIZE) {
    return Error(1, "ed25519PublicKey: seed must be 32 bytes");
  }

  std::string publicKey(crypto_sign_PUBLICKEYBYTES, '\0');
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
  if (crypto_sign_seed_keypair(
        reinterpret_cast<unsigned char*>(publicKey.data()), sk.data(),
        reinterpret_cast<const unsigned char*>(seed.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }
  sodium_memzero(sk.data(), sk.size());
  return publicKey;
}

Roe<std::string> ed25519Sign(const std::string &seed, const std::string &message) {
  if (seed.size() != ED25519_SEED_SIZE) {
    return Error(1, "ed25519Sign: seed must be 32 bytes");
  }

  // Libsodium expects a 64-byte secret key (32 seed + 32 public key)
  std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);

  if (crypto_sign_seed_keypair(
        pk.data(), sk.data(),
        reinterpret_cast<const unsigned char*>(seed.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }

  std::string signature(crypto_sign_BYTES, '\0');
  unsigned long long sigLen = 0;

  int rc = crypto_sign_detached(
      reinterpret_cast<unsigned char*>(signature.data()), &sigLen,
      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
      sk.data());
  sodium_memzero(sk.data(), sk.size());
  if (rc != 0) {
    return Error(3, "crypto_sign_detached failed");
  }

  if (sigLen != ED25519_SIGNATURE_SIZE) {
    return Error(4, "unexpected signature size");
  }

  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
      signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }

  return crypto_sign_verify_detached(
             reinterpret_cast<const unsigned char*>(signature.data()),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             reinterpret_cast<const unsigned char*>(publicKey.data())) == 0;
}

std::string randomBytes(size_t size) {
  std::string bytes(size, '\0');
  randombytes_buf(bytes.data(), bytes.size());
  return bytes;
}

Roe<std::string> readFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error(1, "Cannot open file: " + path);
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }
  return oss.str();
}

} // namespace utl
} // namespace dt
