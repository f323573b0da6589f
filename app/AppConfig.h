#pragma once

#include "../tx/Keys.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace dt {
namespace app {

enum class Network { Mainnet, Devnet, HeliusMainnet };

std::string toString(Network network);

/**
 * AppConfig - settings of one run, built from a network preset and the JSON
 * configuration file.
 *
 * File layout:
 * {
 *   "mainnet":       { "rpcUrl": "...", "wsUrl": "...", "sender": "...", "receiver": "..." },
 *   "devnet":        { ... },
 *   "heliusMainnet": { "apiKey": "...", "sender": "...", "receiver": "..." },
 *   "amount": 1000,
 *   "commitment": "finalized",
 *   "computeUnitLimit": 50000,
 *   "computeUnitPrice": 10000
 * }
 *
 * "sender" is a base58 secret key or the path of a JSON keypair file;
 * "receiver" is a base58 public key or the path of a JSON keypair file.
 */
class AppConfig {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_FILE = 1;
  static constexpr int32_t E_NETWORK = 2;
  static constexpr int32_t E_VALUE = 3;
  static constexpr int32_t E_URL = 4;
  static constexpr int32_t E_KEY = 5;

  Network network{ Network::Devnet };
  std::string rpcUrl;
  std::string wsUrl;
  std::string sender;
  std::string receiver;
  uint64_t amount{ 1000 };
  std::string commitment{ "finalized" };
  uint32_t computeUnitLimit{ 50000 };
  uint64_t computeUnitPrice{ 10000 };

  /** Preset urls of a network; the Helius preset needs an API key */
  static AppConfig preset(Network network);

  static Roe<AppConfig> fromJson(const nlohmann::json &json, Network network);
  static Roe<AppConfig> load(const std::string &path, Network network);

  /** Check urls and commitment, and that both keys can be loaded */
  Roe<void> validate() const;

  Roe<tx::Keypair> loadSender() const;
  Roe<tx::PublicKey> loadReceiver() const;

  std::string explorerUrl(const std::string &signature) const;

  static const char *sectionName(Network network);
};

} // namespace app
} // namespace dt
