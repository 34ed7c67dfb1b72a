#include "netdut/Errors.hpp"
#include "netdut/poll/Poller.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace netdut;
using namespace std::chrono_literals;

TEST(Poller, ZeroTimeoutStillCallsOnce) {
  int calls = 0;
  EXPECT_TRUE(wait_for([&]() { ++calls; return true; }, 0ms));
  EXPECT_EQ(calls, 1);

  calls = 0;
  EXPECT_FALSE(wait_for([&]() { ++calls; return false; }, 0ms));
  EXPECT_EQ(calls, 1);
}

TEST(Poller, NegativeTimeoutStillCallsOnce) {
  int calls = 0;
  EXPECT_FALSE(wait_for([&]() { ++calls; return false; }, -5ms));
  EXPECT_EQ(calls, 1);
}

TEST(Poller, TimesOutAfterDeadline) {
  int calls = 0;
  auto start = std::chrono::steady_clock::now();

  bool ok = wait_for([&]() { ++calls; return false; }, 50ms, 10ms);

  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(ok);
  EXPECT_GT(calls, 1);
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 2000ms);
}

TEST(Poller, HugeTimeoutKeepsPolling) {
  int calls = 0;
  EXPECT_TRUE(wait_for([&]() { return ++calls == 3; },
                       std::chrono::milliseconds::max(), 1ms));
  EXPECT_EQ(calls, 3);

  calls = 0;
  auto four_centuries = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::hours(24 * 365 * 400));
  EXPECT_TRUE(wait_for([&]() { return ++calls == 3; }, four_centuries, 1ms));
  EXPECT_EQ(calls, 3);
}

TEST(Poller, MinimumTimeoutStillCallsOnce) {
  int calls = 0;
  EXPECT_FALSE(wait_for([&]() { ++calls; return false; },
                        std::chrono::milliseconds::min(), 1ms));
  EXPECT_EQ(calls, 1);
}

TEST(Poller, SucceedsOnceConditionHolds) {
  int calls = 0;
  EXPECT_TRUE(wait_for([&]() { return ++calls == 3; }, 1000ms, 1ms));
  EXPECT_EQ(calls, 3);
}

TEST(Poller, PredicateExceptionsPropagate) {
  int calls = 0;
  EXPECT_THROW(wait_for(
                   [&]() -> bool {
                     if (++calls == 2) {
                       throw std::runtime_error("link down");
                     }
                     return false;
                   },
                   1000ms, 1ms),
               std::runtime_error);
  EXPECT_EQ(calls, 2);
}

TEST(Poller, RejectsNonPositiveInterval) {
  EXPECT_THROW(wait_for([]() { return true; }, 10ms, 0ms), ConfigurationError);
  EXPECT_THROW(Poller(PollOptions{1000ms, -1ms}), ConfigurationError);
}

TEST(Poller, WaitForValueReturnsProducedValue) {
  int calls = 0;
  auto value = wait_for_value(
      [&]() -> std::optional<int> {
        if (++calls < 3) {
          return std::nullopt;
        }
        return 42;
      },
      1000ms, 1ms);

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
}

TEST(Poller, WaitForValueTimesOutEmpty) {
  auto value = wait_for_value([]() -> std::optional<std::string> { return {}; },
                              20ms, 5ms);
  EXPECT_FALSE(value.has_value());
}

TEST(Poller, DefaultOptions) {
  Poller poller;
  EXPECT_EQ(poller.options().timeout, 30000ms);
  EXPECT_EQ(poller.options().interval, 100ms);
}

TEST(Poller, UsesConfiguredOptions) {
  Poller poller(PollOptions{30ms, 5ms});
  int calls = 0;

  EXPECT_FALSE(poller.wait([&]() { ++calls; return false; }));
  EXPECT_GT(calls, 1);
  EXPECT_TRUE(poller.wait([]() { return true; }, 0ms));

  auto value = poller.wait_value([]() -> std::optional<int> { return 7; });
  EXPECT_EQ(value, 7);
}
