#include <gtest/gtest.h>
#include <agentcore/core/stop_token.hpp>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using agentcore::core::StopSource;
using agentcore::core::StopToken;

TEST(StopToken, DefaultTokenNeverStops) {
  StopToken t;
  EXPECT_FALSE(t.StopPossible());
  EXPECT_FALSE(t.StopRequested());
  EXPECT_FALSE(t.WaitFor(1ms));
}

TEST(StopToken, RequestIsSeenByAllTokens) {
  StopSource src;
  auto a = src.Token();
  auto b = a;
  EXPECT_FALSE(a.StopRequested());

  EXPECT_TRUE(src.RequestStop());
  EXPECT_TRUE(a.StopRequested());
  EXPECT_TRUE(b.StopRequested());
  EXPECT_TRUE(src.StopRequested());
}

TEST(StopToken, SecondRequestReportsNoTransition) {
  StopSource src;
  EXPECT_TRUE(src.RequestStop());
  EXPECT_FALSE(src.RequestStop());
}

TEST(StopToken, WaitTimesOutWithoutRequest) {
  StopSource src;
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(src.Token().WaitFor(20ms));
  EXPECT_GE(std::chrono::steady_clock::now() - t0, 20ms);
}

TEST(StopToken, RequestWakesBlockedWaiter) {
  StopSource src;
  auto token = src.Token();

  std::thread stopper([&] {
    std::this_thread::sleep_for(30ms);
    src.RequestStop();
  });

  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.WaitFor(std::chrono::seconds(30)));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
  stopper.join();
}
