#include "AppConfig.h"
#include "../network/TpuClient.h"
#include "../rpc/RpcClient.h"
#include "../rpc/SlotFeed.h"
#include "../submit/ConfirmationPoller.h"
#include "../submit/Orchestrator.h"
#include "../submit/Submitter.h"
#include "../tracker/LeaderTracker.h"
#include "../tracker/SlotClock.h"
#include "Logger.h"

#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ATTEMPTS_EXHAUSTED = 1;
constexpr int EXIT_CONFIG = 2;

int run(const dt::app::AppConfig &config, const dt::submit::Orchestrator::Config &runConfig) {
  auto logger = dt::logging::getLogger("direct_tpu");

  // Both were checked by validate()
  auto sender = config.loadSender();
  auto receiver = config.loadReceiver();
  if (!sender || !receiver) {
    std::cerr << "Error: " << (!sender ? sender.error().message : receiver.error().message)
              << "\n";
    return EXIT_CONFIG;
  }

  logger.info << "Network " << dt::app::toString(config.network) << ", rpc "
              << config.rpcUrl;
  logger.info << "Transfer of " << config.amount << " lamports from "
              << sender.value().publicKey().toBase58() << " to "
              << receiver.value().toBase58();

  dt::rpc::RpcClient::Config rpcConfig;
  rpcConfig.url = config.rpcUrl;
  rpcConfig.commitment = config.commitment;
  dt::rpc::RpcClient rpc(rpcConfig);

  dt::tracker::SlotClock clock;
  dt::tracker::LeaderTracker tracker(rpc, clock);

  // The schedule must be known before the first attempt
  auto initResult = tracker.init();
  if (!initResult) {
    logger.error << initResult.error().message;
    std::cout << "Maximum number of attempts reached\n"
              << "Last error: " << initResult.error().message << "\n";
    return EXIT_ATTEMPTS_EXHAUSTED;
  }
  auto refreshResult = tracker.refresh();
  if (!refreshResult) {
    logger.warning << "Initial schedule refresh failed: "
                   << refreshResult.error().message;
  }

  dt::rpc::SlotFeed::Config feedConfig;
  feedConfig.url = config.wsUrl;
  dt::rpc::SlotFeed feed(feedConfig, [&clock](uint64_t slot) { clock.advance(slot); });

  auto feedStarted = feed.start();
  if (!feedStarted) {
    logger.warning << "Slot feed not started: " << feedStarted.error().message;
  }
  auto trackerStarted = tracker.start();
  if (!trackerStarted) {
    logger.warning << "Schedule refresh not started: "
                   << trackerStarted.error().message;
  }

  dt::network::TpuClient transport;

  dt::tx::TransferSpec transfer;
  transfer.receiver = receiver.value();
  transfer.lamports = config.amount;
  transfer.computeUnitLimit = config.computeUnitLimit;
  transfer.computeUnitPrice = config.computeUnitPrice;

  dt::submit::Submitter submitter(rpc, transport, sender.value(), transfer);
  dt::submit::ConfirmationPoller poller(rpc);
  dt::submit::Orchestrator orchestrator(tracker, submitter, poller, runConfig);

  auto result = orchestrator.run();

  feed.stop();
  tracker.stop();
  transport.closeAll();

  if (result.isDone()) {
    std::cout << "Check transaction " << config.explorerUrl(result.signature) << "\n";
    return EXIT_OK;
  }

  std::cout << "Maximum number of attempts reached\n"
            << "Last error: " << result.lastError << "\n";
  return EXIT_ATTEMPTS_EXHAUSTED;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"direct-tpu - Send a transfer straight to the upcoming slot leader"};

  bool mainnet = false;
  bool devnet = false;
  bool heliusMainnet = false;
  auto *networks = app.add_option_group("network", "Cluster to use");
  networks->add_flag("--mainnet", mainnet, "Mainnet beta public endpoints");
  networks->add_flag("--devnet", devnet, "Devnet public endpoints");
  networks->add_flag("--helius-mainnet", heliusMainnet, "Mainnet through Helius");
  networks->require_option(1);

  uint32_t retry = 1;
  app.add_option("--retry", retry, "Number of attempts (default: 1)")
      ->check(CLI::PositiveNumber);

  std::string configPath = "direct-tpu.json";
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->capture_default_str();

  size_t leaders = 4;
  app.add_option("--leaders", leaders, "Upcoming leaders to choose from (default: 4)")
      ->check(CLI::Range(size_t(1), size_t(1000)));

  // The schedule only reaches lookahead slots past the current one
  int64_t offset = 0;
  app.add_option("--offset", offset, "Window start relative to the current slot")
      ->check(CLI::Range(int64_t(-1000), int64_t(1000)));

  std::string policy = "furthest";
  app.add_option("--policy", policy, "Leader of the window to use")
      ->check(CLI::IsMember({"furthest", "nearest"}))
      ->capture_default_str();

  std::string logLevel = "info";
  app.add_option("--log-level", logLevel, "Log level")
      ->check(CLI::IsMember({"debug", "info", "warning", "error"}))
      ->capture_default_str();

  std::string logFile;
  app.add_option("--log-file", logFile, "Also write logs to this file");

  app.footer("Example:\n"
             "  direct-tpu --devnet --retry 5 -c direct-tpu.json\n");

  CLI11_PARSE(app, argc, argv);

  auto rootLogger = dt::logging::getRootLogger();
  rootLogger.setLevel(dt::logging::levelFromString(logLevel).value_or(dt::logging::Level::INFO));
  if (!logFile.empty()) {
    try {
      rootLogger.addFileHandler(logFile, dt::logging::Level::DEBUG);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return EXIT_CONFIG;
    }
  }

  dt::app::Network network = mainnet   ? dt::app::Network::Mainnet
                             : devnet  ? dt::app::Network::Devnet
                                       : dt::app::Network::HeliusMainnet;

  auto config = dt::app::AppConfig::load(configPath, network);
  if (!config) {
    std::cerr << "Error: " << config.error().message << "\n";
    return EXIT_CONFIG;
  }
  auto valid = config.value().validate();
  if (!valid) {
    std::cerr << "Error: " << valid.error().message << "\n";
    return EXIT_CONFIG;
  }

  dt::submit::Orchestrator::Config runConfig;
  runConfig.maxRetry = retry;
  runConfig.leaders = leaders;
  runConfig.offset = offset;
  runConfig.policy = dt::submit::leaderPolicyFromString(policy).value_or(
      dt::submit::LeaderPolicy::Furthest);

  return run(config.value(), runConfig);
}
