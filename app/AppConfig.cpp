#include "AppConfig.h"
#include "Utilities.h"

#include <filesystem>
#include <limits>

namespace dt {
namespace app {

namespace {

const char *const HELIUS_RPC_BASE = "https://mainnet.helius-rpc.com/?api-key=";
const char *const HELIUS_WS_BASE = "wss://mainnet.helius-rpc.com/?api-key=";
const char *const EXPLORER_BASE = "https://explorer.solana.com/tx/";

bool hasScheme(const std::string &url, const std::string &a, const std::string &b) {
  for (const auto &scheme : { a, b }) {
    std::string prefix = scheme + "://";
    if (url.size() > prefix.size() && url.compare(0, prefix.size(), prefix) == 0) {
      return true;
    }
  }
  return false;
}

template <typename T>
bool readNumber(const nlohmann::json &json, const char *key, T &out,
                std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    error = std::string("'") + key + "' must be a non-negative integer in range";
    return false;
  }
  out = static_cast<T>(it->get<uint64_t>());
  return true;
}

bool readString(const nlohmann::json &json, const char *key, std::string &out,
                std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

std::string toString(Network network) {
  switch (network) {
  case Network::Mainnet:
    return "mainnet";
  case Network::Devnet:
    return "devnet";
  case Network::HeliusMainnet:
    return "helius-mainnet";
  }
  return "unknown";
}

const char *AppConfig::sectionName(Network network) {
  switch (network) {
  case Network::Mainnet:
    return "mainnet";
  case Network::Devnet:
    return "devnet";
  case Network::HeliusMainnet:
    return "heliusMainnet";
  }
  return "";
}

AppConfig AppConfig::preset(Network network) {
  AppConfig config;
  config.network = network;
  switch (network) {
  case Network::Mainnet:
    config.rpcUrl = "https://api.mainnet-beta.solana.com";
    config.wsUrl = "wss://api.mainnet-beta.solana.com";
    break;
  case Network::Devnet:
    config.rpcUrl = "https://api.devnet.solana.com";
    config.wsUrl = "wss://api.devnet.solana.com";
    break;
  case Network::HeliusMainnet:
    break;
  }
  return config;
}

AppConfig::Roe<AppConfig> AppConfig::fromJson(const nlohmann::json &json,
                                              Network network) {
  if (!json.is_object()) {
    return Error(E_VALUE, "Configuration must be a JSON object");
  }

  AppConfig config = preset(network);
  std::string error;

  if (!readNumber(json, "amount", config.amount, error) ||
      !readString(json, "commitment", config.commitment, error) ||
      !readNumber(json, "computeUnitLimit", config.computeUnitLimit, error) ||
      !readNumber(json, "computeUnitPrice", config.computeUnitPrice, error)) {
    return Error(E_VALUE, error);
  }

  const char *section = sectionName(network);
  auto it = json.find(section);
  if (it == json.end() || !it->is_object()) {
    return Error(E_NETWORK, std::string("Missing '") + section + "' section");
  }
  const auto &net = *it;

  if (network == Network::HeliusMainnet) {
    std::string apiKey;
    if (!readString(net, "apiKey", apiKey, error)) {
      return Error(E_VALUE, error);
    }
    if (!apiKey.empty()) {
      config.rpcUrl = HELIUS_RPC_BASE + apiKey;
      config.wsUrl = HELIUS_WS_BASE + apiKey;
    }
  }

  if (!readString(net, "rpcUrl", config.rpcUrl, error) ||
      !readString(net, "wsUrl", config.wsUrl, error) ||
      !readString(net, "sender", config.sender, error) ||
      !readString(net, "receiver", config.receiver, error)) {
    return Error(E_VALUE, error);
  }

  return config;
}

AppConfig::Roe<AppConfig> AppConfig::load(const std::string &path, Network network) {
  auto json = utl::loadJsonFile(path);
  if (!json) {
    return Error(E_FILE, "Failed to load configuration: " + json.error().message);
  }
  return fromJson(json.value(), network);
}

AppConfig::Roe<void> AppConfig::validate() const {
  if (rpcUrl.empty() || wsUrl.empty()) {
    return Error(E_URL, std::string("Network '") + toString(network) +
                            "' needs rpcUrl and wsUrl" +
                            (network == Network::HeliusMainnet ? " or apiKey" : ""));
  }
  if (!hasScheme(rpcUrl, "http", "https")) {
    return Error(E_URL, "rpcUrl must be an http(s) url: " + rpcUrl);
  }
  if (!hasScheme(wsUrl, "ws", "wss")) {
    return Error(E_URL, "wsUrl must be a ws(s) url: " + wsUrl);
  }
  if (commitment != "processed" && commitment != "confirmed" &&
      commitment != "finalized") {
    return Error(E_VALUE, "Unknown commitment '" + commitment + "'");
  }
  if (amount == 0) {
    return Error(E_VALUE, "'amount' must be positive");
  }

  auto senderKey = loadSender();
  if (!senderKey) {
    return senderKey.error();
  }
  auto receiverKey = loadReceiver();
  if (!receiverKey) {
    return receiverKey.error();
  }
  return {};
}

AppConfig::Roe<tx::Keypair> AppConfig::loadSender() const {
  if (sender.empty()) {
    return Error(E_KEY, "'sender' is not set");
  }
  std::error_code ec;
  auto keypair = std::filesystem::is_regular_file(sender, ec)
                     ? tx::Keypair::fromFile(sender)
                     : tx::Keypair::fromBase58(sender);
  if (!keypair) {
    return Error(E_KEY, "Invalid sender: " + keypair.error().message);
  }
  return keypair.value();
}

AppConfig::Roe<tx::PublicKey> AppConfig::loadReceiver() const {
  if (receiver.empty()) {
    return Error(E_KEY, "'receiver' is not set");
  }
  std::error_code ec;
  auto key = std::filesystem::is_regular_file(receiver, ec)
                 ? tx::PublicKey::fromKeypairFile(receiver)
                 : tx::PublicKey::fromBase58(receiver);
  if (!key) {
    return Error(E_KEY, "Invalid receiver: " + key.error().message);
  }
  return key.value();
}

std::string AppConfig::explorerUrl(const std::string &signature) const {
  std::string url = EXPLORER_BASE + signature;
  if (network == Network::Devnet) {
    url += "?cluster=devnet";
  }
  return url;
}

} // namespace app
} // namespace dt
