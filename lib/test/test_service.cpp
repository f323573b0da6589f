#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

class CountingService : public dt::Service {
public:
  explicit CountingService(std::chrono::milliseconds interval)
      : dt::Service("test.counting_service"), interval_(interval) {}
  ~CountingService() override { stop(); }

  std::atomic<int> iterations{ 0 };
  std::atomic<int> loopExits{ 0 };

protected:
  void runLoop() override {
    while (waitFor(interval_)) {
      ++iterations;
    }
    ++loopExits;
  }

private:
  std::chrono::milliseconds interval_;
};

} // namespace

TEST(ServiceTest, StartsStoppedAndRunsLoop) {
  CountingService service(std::chrono::milliseconds(1));
  EXPECT_TRUE(service.isStopSet());

  ASSERT_TRUE(service.start().isOk());
  EXPECT_FALSE(service.isStopSet());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (service.iterations < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_GE(service.iterations.load(), 3);

  service.stop();
  EXPECT_TRUE(service.isStopSet());
  EXPECT_EQ(service.loopExits.load(), 1);
}

TEST(ServiceTest, StopWakesLongWait) {
  CountingService service(std::chrono::hours(1));
  ASSERT_TRUE(service.start().isOk());

  auto begin = std::chrono::steady_clock::now();
  service.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
  EXPECT_EQ(service.iterations.load(), 0);
}

TEST(ServiceTest, StartTwiceFails) {
  CountingService service(std::chrono::milliseconds(10));
  ASSERT_TRUE(service.start().isOk());
  auto again = service.start();
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, -1);
}

TEST(ServiceTest, RestartsAfterStop) {
  CountingService service(std::chrono::milliseconds(1));
  ASSERT_TRUE(service.start().isOk());
  service.stop();
  ASSERT_TRUE(service.start().isOk());
  service.stop();
  EXPECT_EQ(service.loopExits.load(), 2);
}

TEST(ServiceTest, StopWithoutStartIsNoop) {
  CountingService service(std::chrono::milliseconds(10));
  service.stop();
  EXPECT_EQ(service.loopExits.load(), 0);
}
