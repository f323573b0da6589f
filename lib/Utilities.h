#ifndef DIRECT_TPU_UTILITIES_H
#define DIRECT_TPU_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dt {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Parse a port number from a string (validates range 1-65535)
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components.
 * The last colon separates the port so bracket-less IPv6 is rejected by parsePort.
 */
bool parseHostPort(const std::string &hostPort, std::string &host, uint16_t &port);

/**
 * Join a vector of strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON document or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Encode binary data with the Bitcoin base58 alphabet (leading zero bytes
 * become leading '1' characters). Used for keys, hashes and signatures.
 */
std::string base58Encode(const std::string &data);

/**
 * Decode a base58 string
 * @return Decoded bytes, or error on characters outside the alphabet
 */
Roe<std::string> base58Decode(const std::string &text);

// --- Ed25519 (raw binary: 32-byte seed, 32-byte public key, 64-byte signature)

/**
 * Derive the public key of an Ed25519 seed
 * @param seed 32-byte private seed
 * @return 32-byte public key, or error
 */
Roe<std::string> ed25519PublicKey(const std::string &seed);

/**
 * Sign a message with an Ed25519 seed
 * @param seed 32-byte private seed
 * @param message Message to sign (arbitrary bytes)
 * @return 64-byte detached signature, or error
 */
Roe<std::string> ed25519Sign(const std::string &seed, const std::string &message);

/**
 * Verify an Ed25519 detached signature
 * @return true if signature is valid, false if invalid or bad key/signature format
 */
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

/**
 * Cryptographically secure random bytes
 */
std::string randomBytes(size_t size);

/**
 * Read a whole file
 */
Roe<std::string> readFile(const std::string &path);

} // namespace utl
} // namespace dt

#endif // DIRECT_TPU_UTILITIES_H
