#include "LeaderTracker.h"
#include "../../rpc/test/MockRpcClient.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <set>
#include <thread>

using ::testing::_;
using ::testing::Return;
using dt::rpc::IRpcClient;
using dt::test::makeNode;
using dt::test::MockRpcClient;
using dt::tracker::LeaderTracker;
using dt::tracker::SlotClock;

namespace {

std::vector<std::string> identities(const dt::tracker::LeaderWindow &window) {
  std::vector<std::string> result;
  for (const auto &contact : window) {
    result.push_back(contact.identity);
  }
  return result;
}

class LeaderTrackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ON_CALL(rpc_, getSlot()).WillByDefault(Return(IRpcClient::Roe<uint64_t>(1000)));
    ON_CALL(rpc_, getSlotLeaders(_, _))
        .WillByDefault(Return(IRpcClient::Roe<std::vector<std::string>>(
            std::vector<std::string>{ "A", "A", "B", "B", "C" })));
    ON_CALL(rpc_, getClusterNodes())
        .WillByDefault(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
            std::vector<dt::rpc::ClusterNode>{ makeNode("A", "10.0.0.1:8009"),
                                               makeNode("B", "10.0.0.2:8009"),
                                               makeNode("C", "10.0.0.3:8009") })));
  }

  LeaderTracker::Config config() const {
    LeaderTracker::Config config;
    config.lookahead = 5;
    return config;
  }

  ::testing::NiceMock<MockRpcClient> rpc_;
  SlotClock clock_;
};

} // namespace

TEST_F(LeaderTrackerTest, InitSeedsClock) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.init().isOk());
  EXPECT_EQ(clock_.read(), 1000u);
}

TEST_F(LeaderTrackerTest, InitFailureIsSlotError) {
  EXPECT_CALL(rpc_, getSlot())
      .WillOnce(Return(IRpcClient::Roe<uint64_t>(IRpcClient::Error(2, "down"))));
  LeaderTracker tracker(rpc_, clock_, config());
  auto result = tracker.init();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, LeaderTracker::E_SLOT);
}

TEST_F(LeaderTrackerTest, RefreshFetchesLookaheadFromCurrentSlot) {
  EXPECT_CALL(rpc_, getSlotLeaders(1000u, 5u)).Times(1);
  LeaderTracker tracker(rpc_, clock_, config());

  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats->startSlot, 1000u);
  EXPECT_EQ(stats->scheduled, 5u);
  EXPECT_EQ(stats->missingLeaders, 0u);
  EXPECT_EQ(stats->unreachable, 0u);
  EXPECT_EQ(tracker.getCache().size(), 5u);
  ASSERT_TRUE(tracker.getCache().find(1002).has_value());
  EXPECT_EQ(tracker.getCache().find(1002)->identity, "B");
  EXPECT_EQ(tracker.getCache().find(1002)->ingestion->toString(), "10.0.0.2:8009");
}

TEST_F(LeaderTrackerTest, WindowTakesDistinctLeadersInSlotOrder) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_EQ(identities(tracker.getWindow(2, 0)), (std::vector<std::string>{ "A", "B" }));
  EXPECT_EQ(identities(tracker.getWindow(1, 0)), (std::vector<std::string>{ "A" }));
  EXPECT_EQ(identities(tracker.getWindow(3, 0)),
            (std::vector<std::string>{ "A", "B", "C" }));
}

TEST_F(LeaderTrackerTest, WindowHonorsOffset) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_EQ(identities(tracker.getWindow(2, 2)), (std::vector<std::string>{ "B", "C" }));
  EXPECT_EQ(identities(tracker.getWindow(2, 4)), (std::vector<std::string>{ "C" }));
  // Slots before the current one were purged
  EXPECT_EQ(identities(tracker.getWindow(2, -1)), (std::vector<std::string>{ "A", "B" }));
}

TEST_F(LeaderTrackerTest, NegativeStartClampsToZero) {
  clock_.advance(3);
  ON_CALL(rpc_, getSlot()).WillByDefault(Return(IRpcClient::Roe<uint64_t>(0)));
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());
  EXPECT_EQ(identities(tracker.getWindow(1, -100)), (std::vector<std::string>{ "A" }));
}

TEST_F(LeaderTrackerTest, WindowDegradesWithoutBlocking) {
  LeaderTracker emptyTracker(rpc_, clock_, config());
  EXPECT_TRUE(emptyTracker.getWindow(4, 0).empty());

  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());
  EXPECT_EQ(tracker.getWindow(10, 0).size(), 3u);
  EXPECT_TRUE(tracker.getWindow(0, 0).empty());
  EXPECT_TRUE(tracker.getWindow(4, 100).empty());
}

TEST_F(LeaderTrackerTest, ScanStopsAfterLeaderTerms) {
  // One leader holding the first eight slots hides the next one from n = 2
  ON_CALL(rpc_, getSlotLeaders(_, _))
      .WillByDefault(Return(IRpcClient::Roe<std::vector<std::string>>(
          std::vector<std::string>{ "A", "A", "A", "A", "A", "A", "A", "A", "B" })));
  auto cfg = config();
  cfg.lookahead = 9;
  LeaderTracker tracker(rpc_, clock_, cfg);
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_EQ(identities(tracker.getWindow(2, 0)), (std::vector<std::string>{ "A" }));
  EXPECT_EQ(identities(tracker.getWindow(3, 0)), (std::vector<std::string>{ "A", "B" }));
}

TEST_F(LeaderTrackerTest, RefreshPurgesPassedSlots) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_CALL(rpc_, getSlot()).WillOnce(Return(IRpcClient::Roe<uint64_t>(1003)));
  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats->purged, 3u);
  ASSERT_TRUE(tracker.getCache().firstSlot().has_value());
  EXPECT_GE(*tracker.getCache().firstSlot(), clock_.read());
  EXPECT_EQ(tracker.getCache().size(), 5u);
}

TEST_F(LeaderTrackerTest, StaleAuthoritativeSlotDoesNotMoveClockBack) {
  clock_.advance(1002);
  EXPECT_CALL(rpc_, getSlotLeaders(1002u, 5u)).Times(1);
  LeaderTracker tracker(rpc_, clock_, config());

  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(clock_.read(), 1002u);
  EXPECT_EQ(stats->startSlot, 1002u);
}

TEST_F(LeaderTrackerTest, LeadersMissingFromDirectoryAreCounted) {
  ON_CALL(rpc_, getClusterNodes())
      .WillByDefault(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
          std::vector<dt::rpc::ClusterNode>{ makeNode("A", "10.0.0.1:8009"),
                                             makeNode("B", std::nullopt) })));
  LeaderTracker tracker(rpc_, clock_, config());

  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats->missingLeaders, 1u); // C
  EXPECT_EQ(stats->unreachable, 2u);    // B twice
  EXPECT_EQ(stats->scheduled, 4u);
  EXPECT_FALSE(tracker.getCache().find(1004).has_value());

  auto window = tracker.getWindow(3, 0);
  ASSERT_EQ(window.size(), 2u);
  EXPECT_TRUE(window[0].isReachable());
  EXPECT_FALSE(window[1].isReachable());
}

TEST_F(LeaderTrackerTest, MalformedTpuAddressIsUnreachable) {
  ON_CALL(rpc_, getClusterNodes())
      .WillByDefault(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
          std::vector<dt::rpc::ClusterNode>{ makeNode("A", "garbage"),
                                             makeNode("B", "10.0.0.2:8009"),
                                             makeNode("C", "10.0.0.3:8009") })));
  LeaderTracker tracker(rpc_, clock_, config());
  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats->unreachable, 2u);
  EXPECT_FALSE(tracker.getCache().find(1000)->isReachable());
}

TEST_F(LeaderTrackerTest, LegacyTpuAddressIsNotIngestion) {
  dt::rpc::ClusterNode legacy;
  legacy.pubkey = "A";
  legacy.tpu = "10.0.0.1:8003";
  ON_CALL(rpc_, getClusterNodes())
      .WillByDefault(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
          std::vector<dt::rpc::ClusterNode>{ legacy, makeNode("B", "10.0.0.2:8009"),
                                             makeNode("C", "10.0.0.3:8009") })));
  LeaderTracker tracker(rpc_, clock_, config());
  auto stats = tracker.refresh();
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats->unreachable, 2u);
  EXPECT_FALSE(tracker.getCache().find(1000)->isReachable());
}

TEST_F(LeaderTrackerTest, WindowBoundsSaturate) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  const int64_t minOffset = std::numeric_limits<int64_t>::min();
  const int64_t maxOffset = std::numeric_limits<int64_t>::max();
  const size_t maxCount = std::numeric_limits<size_t>::max();

  EXPECT_EQ(identities(tracker.getWindow(3, minOffset)),
            (std::vector<std::string>{ "A", "B", "C" }));
  EXPECT_TRUE(tracker.getWindow(3, maxOffset).empty());
  EXPECT_EQ(identities(tracker.getWindow(maxCount, 0)),
            (std::vector<std::string>{ "A", "B", "C" }));
  EXPECT_EQ(identities(tracker.getWindow(maxCount, 2)),
            (std::vector<std::string>{ "B", "C" }));
  EXPECT_TRUE(tracker.getWindow(maxCount, maxOffset).empty());
}

TEST_F(LeaderTrackerTest, RefreshErrorsKeepCache) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_CALL(rpc_, getSlotLeaders(_, _))
      .WillOnce(Return(IRpcClient::Roe<std::vector<std::string>>(
          IRpcClient::Error(5, "rpc failure"))))
      .WillRepeatedly(Return(IRpcClient::Roe<std::vector<std::string>>(
          std::vector<std::string>{ "A", "A", "B", "B", "C" })));
  auto leadersFailed = tracker.refresh();
  ASSERT_TRUE(leadersFailed.isError());
  EXPECT_EQ(leadersFailed.error().code, LeaderTracker::E_LEADERS);

  EXPECT_CALL(rpc_, getClusterNodes())
      .WillOnce(Return(IRpcClient::Roe<std::vector<dt::rpc::ClusterNode>>(
          IRpcClient::Error(2, "timeout"))));
  auto nodesFailed = tracker.refresh();
  ASSERT_TRUE(nodesFailed.isError());
  EXPECT_EQ(nodesFailed.error().code, LeaderTracker::E_CLUSTER_NODES);

  EXPECT_EQ(tracker.getCache().size(), 5u);
}

TEST_F(LeaderTrackerTest, BackgroundLoopRefreshesAndRetries) {
  std::atomic<int> calls{ 0 };
  ON_CALL(rpc_, getSlot()).WillByDefault([&calls]() {
    // Every other refresh fails and is retried after the backoff
    return ++calls % 2 == 0 ? IRpcClient::Roe<uint64_t>(IRpcClient::Error(2, "flaky"))
                            : IRpcClient::Roe<uint64_t>(1000);
  });

  auto cfg = config();
  cfg.refreshInterval = std::chrono::milliseconds(5);
  cfg.retryBackoff = std::chrono::milliseconds(1);
  LeaderTracker tracker(rpc_, clock_, cfg);
  ASSERT_TRUE(tracker.start().isOk());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (calls < 6 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  tracker.stop();

  EXPECT_GE(calls.load(), 6);
  EXPECT_EQ(tracker.getCache().size(), 5u);
}

TEST_F(LeaderTrackerTest, FailedInitialRefreshIsRetriedAfterBackoff) {
  EXPECT_CALL(rpc_, getSlotLeaders(_, _))
      .WillOnce(Return(IRpcClient::Roe<std::vector<std::string>>(
          IRpcClient::Error(5, "rpc failure"))))
      .WillRepeatedly(Return(IRpcClient::Roe<std::vector<std::string>>(
          std::vector<std::string>{ "A", "A", "B", "B", "C" })));

  auto cfg = config();
  cfg.refreshInterval = std::chrono::milliseconds(3000);
  cfg.retryBackoff = std::chrono::milliseconds(50);
  LeaderTracker tracker(rpc_, clock_, cfg);

  ASSERT_TRUE(tracker.refresh().isError());
  EXPECT_FALSE(tracker.isScheduleFresh());
  ASSERT_TRUE(tracker.start().isOk());

  // Well before refreshInterval elapses
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1500);
  while (tracker.getCache().size() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  tracker.stop();

  EXPECT_EQ(tracker.getCache().size(), 5u);
  EXPECT_TRUE(tracker.isScheduleFresh());
  EXPECT_EQ(identities(tracker.getWindow(2, 0)), (std::vector<std::string>{ "A", "B" }));
}

TEST_F(LeaderTrackerTest, LoopFailureIsRetriedAfterBackoff) {
  EXPECT_CALL(rpc_, getSlotLeaders(_, _))
      .WillOnce(Return(IRpcClient::Roe<std::vector<std::string>>(
          IRpcClient::Error(5, "rpc failure"))))
      .WillOnce(Return(IRpcClient::Roe<std::vector<std::string>>(
          IRpcClient::Error(5, "rpc failure"))))
      .WillRepeatedly(Return(IRpcClient::Roe<std::vector<std::string>>(
          std::vector<std::string>{ "A", "A", "B", "B", "C" })));

  auto cfg = config();
  cfg.refreshInterval = std::chrono::milliseconds(3000);
  cfg.retryBackoff = std::chrono::milliseconds(50);
  LeaderTracker tracker(rpc_, clock_, cfg);
  ASSERT_TRUE(tracker.start().isOk());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1500);
  while (!tracker.isScheduleFresh() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  tracker.stop();

  EXPECT_TRUE(tracker.isScheduleFresh());
  EXPECT_EQ(tracker.getCache().size(), 5u);
}

TEST_F(LeaderTrackerTest, FreshScheduleWaitsFullInterval) {
  LeaderTracker tracker(rpc_, clock_, [this] {
    auto cfg = config();
    cfg.refreshInterval = std::chrono::milliseconds(60000);
    return cfg;
  }());
  ASSERT_TRUE(tracker.refresh().isOk());

  EXPECT_CALL(rpc_, getSlotLeaders(_, _)).Times(0);
  ASSERT_TRUE(tracker.start().isOk());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  tracker.stop();
}

TEST_F(LeaderTrackerTest, WindowsDuringRefreshStayDistinct) {
  LeaderTracker tracker(rpc_, clock_, config());
  ASSERT_TRUE(tracker.refresh().isOk());

  std::atomic<bool> done{ false };
  std::thread writer([&] {
    for (int i = 0; i < 200; ++i) {
      tracker.refresh();
    }
    done = true;
  });

  bool duplicate = false;
  while (!done) {
    auto window = tracker.getWindow(3, 0);
    std::set<std::string> unique;
    for (const auto &contact : window) {
      if (!unique.insert(contact.identity).second) {
        duplicate = true;
      }
    }
  }
  writer.join();
  EXPECT_FALSE(duplicate);
}
