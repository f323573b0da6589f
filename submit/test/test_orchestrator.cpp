#include "Orchestrator.h"
#include "FakeTransport.h"
#include "../../rpc/test/MockRpcClient.h"
#include "Utilities.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

using ::testing::_;
using ::testing::Return;
using dt::rpc::IRpcClient;
using dt::rpc::SignatureStatus;
using dt::submit::ConfirmationPoller;
using dt::submit::LeaderPolicy;
using dt::submit::Orchestrator;
using dt::submit::Submitter;
using dt::test::FakeTransport;
using dt::test::makeNode;
using dt::test::MockRpcClient;
using dt::tracker::LeaderTracker;
using dt::tracker::SlotClock;

namespace {

using StatusRoe = IRpcClient::Roe<std::optional<SignatureStatus>>;

StatusRoe notFound() { return StatusRoe(std::optional<SignatureStatus>()); }

StatusRoe confirmed() {
  SignatureStatus status;
  status.slot = 1002;
  status.confirmations = 1;
  status.confirmationStatus = "confirmed";
  return StatusRoe(std::optional<SignatureStatus>(status));
}

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Four leaders, one term of four slots each, starting at slot 1000
    std::vector<std::string> schedule;
    for (const char *identity : { "A", "B", "C", "D" }) {
      schedule.insert(schedule.end(), 4, identity);
    }
    ON_CALL(rpc_, getSlot()).WillByDefault(Return(IRpcClient::Roe<uint64_t>(1000)));
    ON_CALL(rpc_, getSlotLeaders(_, _))
        .WillByDefault(Return(IRpcClient::Roe<std::vector<std::string>>(schedule)));
    ON_CALL(rpc_, getClusterNodes())
        .WillByDefault(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
            std::vector<dt::rpc::ClusterNode>{ makeNode("A", "10.0.0.1:8009"),
                                               makeNode("B", "10.0.0.2:8009"),
                                               makeNode("C", "10.0.0.3:8009"),
                                               makeNode("D", "10.0.0.4:8009") })));
    ON_CALL(rpc_, getLatestBlockhash()).WillByDefault([this]() {
      ++blockhashCalls_;
      std::string hash(32, '\x01');
      hash[31] = static_cast<char>(blockhashCalls_);
      return IRpcClient::Roe<std::string>(dt::utl::base58Encode(hash));
    });
    ON_CALL(rpc_, getSignatureStatus(_)).WillByDefault(Return(notFound()));
    ON_CALL(rpc_, getTransaction(_))
        .WillByDefault(Return(IRpcClient::Roe<nlohmann::json>(nlohmann::json())));

    auto keypair = dt::tx::Keypair::fromSeed(std::string(32, '\x11'));
    ASSERT_TRUE(keypair.isOk());
    sender_ = keypair.value();
    transfer_.receiver = dt::tx::PublicKey::fromBytes(std::string(32, '\x22')).value();

    LeaderTracker::Config trackerConfig;
    trackerConfig.lookahead = 16;
    tracker_ = std::make_unique<LeaderTracker>(rpc_, clock_, trackerConfig);
    ASSERT_TRUE(tracker_->init().isOk());
    ASSERT_TRUE(tracker_->refresh().isOk());

    submitter_ = std::make_unique<Submitter>(rpc_, transport_, sender_, transfer_);
    ConfirmationPoller::Config pollerConfig;
    pollerConfig.maxAttempts = 3;
    pollerConfig.interval = std::chrono::milliseconds(2000);
    poller_ = std::make_unique<ConfirmationPoller>(rpc_, pollerConfig, recorder());
  }

  dt::submit::Sleeper recorder() {
    return [this](std::chrono::milliseconds d) { sleeps_.push_back(d); };
  }

  Orchestrator::RunResult run(const Orchestrator::Config &config) {
    Orchestrator orchestrator(*tracker_, *submitter_, *poller_, config,
                              [this](std::chrono::milliseconds d) {
                                retrySleeps_.push_back(d);
                              });
    return orchestrator.run();
  }

  ::testing::NiceMock<MockRpcClient> rpc_;
  FakeTransport transport_;
  SlotClock clock_;
  dt::tx::Keypair sender_;
  dt::tx::TransferSpec transfer_;
  std::unique_ptr<LeaderTracker> tracker_;
  std::unique_ptr<Submitter> submitter_;
  std::unique_ptr<ConfirmationPoller> poller_;
  std::vector<std::chrono::milliseconds> sleeps_;
  std::vector<std::chrono::milliseconds> retrySleeps_;
  int blockhashCalls_{ 0 };
};

} // namespace

TEST_F(OrchestratorTest, FurthestLeaderIsDefault) {
  EXPECT_CALL(rpc_, getSignatureStatus(_)).WillOnce(Return(confirmed()));

  auto result = run(Orchestrator::Config{});
  EXPECT_TRUE(result.isDone());
  EXPECT_EQ(result.attempts, 1u);
  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].endpoint.toString(), "10.0.0.4:8009");
  EXPECT_EQ(result.signature,
            dt::utl::base58Encode(transport_.sent[0].payload.substr(1, 64)));
  EXPECT_TRUE(retrySleeps_.empty());
}

TEST_F(OrchestratorTest, NearestLeaderPolicy) {
  EXPECT_CALL(rpc_, getSignatureStatus(_)).WillOnce(Return(confirmed()));
  Orchestrator::Config config;
  config.policy = LeaderPolicy::Nearest;

  auto result = run(config);
  EXPECT_TRUE(result.isDone());
  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].endpoint.toString(), "10.0.0.1:8009");
}

TEST_F(OrchestratorTest, SmallerWindowMovesFurthestLeaderCloser) {
  EXPECT_CALL(rpc_, getSignatureStatus(_)).WillOnce(Return(confirmed()));
  Orchestrator::Config config;
  config.leaders = 2;

  auto result = run(config);
  EXPECT_TRUE(result.isDone());
  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].endpoint.toString(), "10.0.0.2:8009");
}

TEST_F(OrchestratorTest, RetriesStopAtMaxRetry) {
  Orchestrator::Config config;
  config.maxRetry = 3;

  auto result = run(config);
  EXPECT_EQ(result.state, Orchestrator::State::Failed);
  EXPECT_EQ(result.attempts, 3u);
  EXPECT_TRUE(result.signature.empty());
  EXPECT_FALSE(result.lastError.empty());
  EXPECT_EQ(transport_.sent.size(), 3u);
  EXPECT_EQ(retrySleeps_.size(), 2u);
  for (auto d : retrySleeps_) {
    EXPECT_EQ(d, std::chrono::milliseconds(1000));
  }
}

TEST_F(OrchestratorTest, RetryBuildsNewTransaction) {
  EXPECT_CALL(rpc_, getSignatureStatus(_))
      .WillOnce(Return(notFound()))
      .WillOnce(Return(notFound()))
      .WillOnce(Return(notFound()))
      .WillOnce(Return(confirmed()));
  Orchestrator::Config config;
  config.maxRetry = 2;

  auto result = run(config);
  EXPECT_TRUE(result.isDone());
  EXPECT_EQ(result.attempts, 2u);
  ASSERT_EQ(transport_.sent.size(), 2u);
  EXPECT_NE(transport_.sent[0].payload, transport_.sent[1].payload);
  EXPECT_EQ(result.signature,
            dt::utl::base58Encode(transport_.sent[1].payload.substr(1, 64)));
  EXPECT_EQ(blockhashCalls_, 2);
}

TEST_F(OrchestratorTest, EmptyWindowFailsWithoutSending) {
  Orchestrator::Config config;
  config.maxRetry = 2;
  config.offset = 100000;

  auto result = run(config);
  EXPECT_EQ(result.state, Orchestrator::State::Failed);
  EXPECT_EQ(result.attempts, 2u);
  EXPECT_TRUE(transport_.sent.empty());
  EXPECT_NE(result.lastError.find("No leader"), std::string::npos);
}

TEST_F(OrchestratorTest, SendFailureIsRetried) {
  EXPECT_CALL(rpc_, getSignatureStatus(_)).WillOnce(Return(confirmed()));
  transport_.failures = 1;
  Orchestrator::Config config;
  config.maxRetry = 2;

  auto result = run(config);
  EXPECT_TRUE(result.isDone());
  EXPECT_EQ(result.attempts, 2u);
  EXPECT_EQ(transport_.sent.size(), 2u);
  EXPECT_EQ(retrySleeps_.size(), 1u);
}

TEST_F(OrchestratorTest, ZeroMaxRetryMakesOneAttempt) {
  Orchestrator::Config config;
  config.maxRetry = 0;

  auto result = run(config);
  EXPECT_EQ(result.state, Orchestrator::State::Failed);
  EXPECT_EQ(result.attempts, 1u);
  EXPECT_EQ(transport_.sent.size(), 1u);
  EXPECT_TRUE(retrySleeps_.empty());
}

TEST(LeaderPolicyTest, NamesRoundTrip) {
  EXPECT_EQ(dt::submit::leaderPolicyFromString("furthest"), LeaderPolicy::Furthest);
  EXPECT_EQ(dt::submit::leaderPolicyFromString("nearest"), LeaderPolicy::Nearest);
  EXPECT_FALSE(dt::submit::leaderPolicyFromString("middle").has_value());
  EXPECT_EQ(dt::submit::toString(LeaderPolicy::Nearest), "nearest");
  EXPECT_EQ(dt::submit::toString(Orchestrator::State::Retry), "Retry");
}
