#pragma once

#include "IRpcClient.hpp"
#include "Module.h"

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace dt {
namespace rpc {

/**
 * RpcClient - JSON-RPC 2.0 client for the cluster query service over HTTP(S).
 *
 * Every call opens its own HTTP client so the refresh loop and the
 * submission flow never wait on each other.
 */
class RpcClient : public IRpcClient, public Module {
public:
  struct Config {
    std::string url;                      // http(s)://host[:port][/path][?query]
    std::string commitment{ "finalized" };
    std::chrono::milliseconds connectTimeout{ 10000 };
    std::chrono::milliseconds readTimeout{ 30000 };
  };

  // Error codes
  static constexpr int32_t E_CONFIG = 1;
  static constexpr int32_t E_HTTP = 2;
  static constexpr int32_t E_HTTP_STATUS = 3;
  static constexpr int32_t E_PARSE = 4;
  static constexpr int32_t E_RPC = 5;

  explicit RpcClient(const Config &config);
  ~RpcClient() override = default;

  const Config &getConfig() const { return config_; }

  Roe<uint64_t> getSlot() override;
  Roe<std::vector<std::string>> getSlotLeaders(uint64_t startSlot,
                                               uint64_t limit) override;
  Roe<std::vector<ClusterNode>> getClusterNodes() override;
  Roe<std::string> getLatestBlockhash() override;
  Roe<std::optional<SignatureStatus>>
  getSignatureStatus(const std::string &signature) override;
  Roe<nlohmann::json> getTransaction(const std::string &signature) override;

  // ----- response parsing, independent of the network -----

  struct UrlParts {
    std::string schemeHostPort; // "https://host:port"
    std::string path;           // "/path?query", "/" when absent
  };
  static Roe<UrlParts> splitUrl(const std::string &url);

  /** Unwrap a JSON-RPC response body into its "result" member */
  static Roe<nlohmann::json> extractResult(const std::string &body);

  static Roe<uint64_t> parseSlot(const nlohmann::json &result);
  static Roe<std::vector<std::string>> parseSlotLeaders(const nlohmann::json &result);
  static Roe<std::vector<ClusterNode>> parseClusterNodes(const nlohmann::json &result);
  static Roe<std::string> parseLatestBlockhash(const nlohmann::json &result);
  static Roe<std::optional<SignatureStatus>>
  parseSignatureStatus(const nlohmann::json &result);

private:
  Roe<nlohmann::json> call(const std::string &method, const nlohmann::json &params);
  nlohmann::json commitmentParams() const;

  Config config_;
  UrlParts url_;
  std::atomic<uint64_t> nextId_{ 1 };
};

} // namespace rpc
} // namespace dt
