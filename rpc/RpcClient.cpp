#include "RpcClient.h"

#include <httplib.h>

namespace dt {
namespace rpc {

namespace {

std::optional<std::string> optionalString(const nlohmann::json &object,
                                          const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

} // namespace

nlohmann::json RpcClient::commitmentParams() const {
  nlohmann::json options = nlohmann::json::object();
  options["commitment"] = config_.commitment;
  return nlohmann::json::array({options});
}

RpcClient::RpcClient(const Config &config)
    : Module("rpc.client"), config_(config) {
  auto parts = splitUrl(config_.url);
  if (!parts) {
    log().error << "Invalid RPC url: " << parts.error().message;
    return;
  }
  url_ = parts.value();
}

RpcClient::Roe<RpcClient::UrlParts> RpcClient::splitUrl(const std::string &url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return Error(E_CONFIG, "Missing scheme in url: " + url);
  }
  std::string scheme = url.substr(0, schemeEnd);
  if (scheme != "http" && scheme != "https") {
    return Error(E_CONFIG, "Unsupported scheme '" + scheme + "' in url: " + url);
  }

  auto hostStart = schemeEnd + 3;
  auto pathStart = url.find_first_of("/?", hostStart);
  UrlParts parts;
  parts.schemeHostPort = url.substr(0, pathStart);
  if (parts.schemeHostPort.size() == hostStart) {
    return Error(E_CONFIG, "Missing host in url: " + url);
  }
  if (pathStart == std::string::npos) {
    parts.path = "/";
  } else if (url[pathStart] == '?') {
    parts.path = "/" + url.substr(pathStart);
  } else {
    parts.path = url.substr(pathStart);
  }
  return parts;
}

RpcClient::Roe<nlohmann::json> RpcClient::call(const std::string &method,
                                               const nlohmann::json &params) {
  if (url_.schemeHostPort.empty()) {
    return Error(E_CONFIG, "RPC url is not usable: " + config_.url);
  }

  nlohmann::json request = {
      {"jsonrpc", "2.0"}, {"id", nextId_.fetch_add(1)}, {"method", method}};
  if (!params.is_null()) {
    request["params"] = params;
  }

  httplib::Client client(url_.schemeHostPort);
  client.set_connection_timeout(config_.connectTimeout);
  client.set_read_timeout(config_.readTimeout);
  client.set_write_timeout(config_.readTimeout);

  log().debug << "-> " << method;
  auto res = client.Post(url_.path, request.dump(), "application/json");
  if (!res) {
    return Error(E_HTTP, method + ": " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    return Error(E_HTTP_STATUS, method + ": HTTP " + std::to_string(res->status) +
                                    " " + res->body.substr(0, 256));
  }

  auto result = extractResult(res->body);
  if (!result) {
    return Error(result.error().code, method + ": " + result.error().message);
  }
  return result;
}

RpcClient::Roe<nlohmann::json> RpcClient::extractResult(const std::string &body) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_PARSE, std::string("Malformed JSON response: ") + e.what());
  }

  if (!response.is_object()) {
    return Error(E_PARSE, "Response is not a JSON object");
  }
  auto err = response.find("error");
  if (err != response.end() && !err->is_null()) {
    std::string message = err->is_object() ? err->value("message", err->dump())
                                           : err->dump();
    int64_t code = err->is_object() ? err->value("code", int64_t{ 0 }) : 0;
    return Error(E_RPC, "RPC error " + std::to_string(code) + ": " + message);
  }
  auto it = response.find("result");
  if (it == response.end()) {
    return Error(E_PARSE, "Response has neither result nor error");
  }
  return *it;
}

RpcClient::Roe<uint64_t> RpcClient::parseSlot(const nlohmann::json &result) {
  if (!result.is_number_unsigned()) {
    return Error(E_PARSE, "Slot is not an unsigned integer: " + result.dump());
  }
  return result.get<uint64_t>();
}

RpcClient::Roe<std::vector<std::string>>
RpcClient::parseSlotLeaders(const nlohmann::json &result) {
  if (!result.is_array()) {
    return Error(E_PARSE, "Slot leaders is not an array");
  }
  std::vector<std::string> leaders;
  leaders.reserve(result.size());
  for (const auto &leader : result) {
    if (!leader.is_string()) {
      return Error(E_PARSE, "Slot leader is not a string: " + leader.dump());
    }
    leaders.push_back(leader.get<std::string>());
  }
  return leaders;
}

RpcClient::Roe<std::vector<ClusterNode>>
RpcClient::parseClusterNodes(const nlohmann::json &result) {
  if (!result.is_array()) {
    return Error(E_PARSE, "Cluster nodes is not an array");
  }
  std::vector<ClusterNode> nodes;
  nodes.reserve(result.size());
  for (const auto &entry : result) {
    auto pubkey = entry.is_object() ? optionalString(entry, "pubkey") : std::nullopt;
    if (!pubkey) {
      return Error(E_PARSE, "Cluster node without pubkey: " + entry.dump());
    }
    ClusterNode node;
    node.pubkey = *pubkey;
    node.gossip = optionalString(entry, "gossip");
    node.tpu = optionalString(entry, "tpu");
    node.tpuQuic = optionalString(entry, "tpuQuic");
    node.tpuForwards = optionalString(entry, "tpuForwards");
    node.version = optionalString(entry, "version");
    nodes.push_back(std::move(node));
  }
  return nodes;
}

RpcClient::Roe<std::string>
RpcClient::parseLatestBlockhash(const nlohmann::json &result) {
  if (!result.is_object() || !result.contains("value") ||
      !result["value"].is_object()) {
    return Error(E_PARSE, "Latest blockhash response has no value object");
  }
  auto blockhash = optionalString(result["value"], "blockhash");
  if (!blockhash || blockhash->empty()) {
    return Error(E_PARSE, "Latest blockhash response has no blockhash");
  }
  return *blockhash;
}

RpcClient::Roe<std::optional<SignatureStatus>>
RpcClient::parseSignatureStatus(const nlohmann::json &result) {
  if (!result.is_object() || !result.contains("value") ||
      !result["value"].is_array()) {
    return Error(E_PARSE, "Signature statuses response has no value array");
  }
  const auto &values = result["value"];
  if (values.empty() || values[0].is_null()) {
    return std::optional<SignatureStatus>();
  }
  const auto &entry = values[0];
  if (!entry.is_object()) {
    return Error(E_PARSE, "Signature status is not an object: " + entry.dump());
  }

  SignatureStatus status;
  if (entry.contains("slot") && entry["slot"].is_number_unsigned()) {
    status.slot = entry["slot"].get<uint64_t>();
  }
  if (entry.contains("confirmations") && entry["confirmations"].is_number_unsigned()) {
    status.confirmations = entry["confirmations"].get<uint64_t>();
  }
  status.confirmationStatus = optionalString(entry, "confirmationStatus");
  if (entry.contains("err") && !entry["err"].is_null()) {
    status.err = entry["err"].dump();
  }
  return std::optional<SignatureStatus>(status);
}

RpcClient::Roe<uint64_t> RpcClient::getSlot() {
  auto result = call("getSlot", commitmentParams());
  if (!result) {
    return result.error();
  }
  return parseSlot(result.value());
}

RpcClient::Roe<std::vector<std::string>>
RpcClient::getSlotLeaders(uint64_t startSlot, uint64_t limit) {
  auto result = call("getSlotLeaders", nlohmann::json::array({startSlot, limit}));
  if (!result) {
    return result.error();
  }
  return parseSlotLeaders(result.value());
}

RpcClient::Roe<std::vector<ClusterNode>> RpcClient::getClusterNodes() {
  auto result = call("getClusterNodes", nullptr);
  if (!result) {
    return result.error();
  }
  return parseClusterNodes(result.value());
}

RpcClient::Roe<std::string> RpcClient::getLatestBlockhash() {
  auto result = call("getLatestBlockhash", commitmentParams());
  if (!result) {
    return result.error();
  }
  return parseLatestBlockhash(result.value());
}

RpcClient::Roe<std::optional<SignatureStatus>>
RpcClient::getSignatureStatus(const std::string &signature) {
  nlohmann::json params = nlohmann::json::array(
      {nlohmann::json::array({signature}),
       {{"searchTransactionHistory", false}}});
  auto result = call("getSignatureStatuses", params);
  if (!result) {
    return result.error();
  }
  return parseSignatureStatus(result.value());
}

RpcClient::Roe<nlohmann::json> RpcClient::getTransaction(const std::string &signature) {
  // getTransaction does not serve the "processed" level
  std::string commitment =
      config_.commitment == "processed" ? "confirmed" : config_.commitment;
  nlohmann::json params = nlohmann::json::array(
      {signature,
       {{"encoding", "json"},
        {"commitment", commitment},
        {"maxSupportedTransactionVersion", 0}}});
  return call("getTransaction", params);
}

} // namespace rpc
} // namespace dt
