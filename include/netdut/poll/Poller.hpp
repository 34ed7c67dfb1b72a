#pragma once
#include "netdut/Logger.hpp"
#include "netdut/export.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <thread>
#include <utility>

namespace netdut {

inline constexpr std::chrono::milliseconds DEFAULT_POLL_TIMEOUT{30000};
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

struct PollOptions {
  std::chrono::milliseconds timeout{DEFAULT_POLL_TIMEOUT};
  std::chrono::milliseconds interval{DEFAULT_POLL_INTERVAL};
};

using Predicate = std::function<bool()>;

/// Throws ConfigurationError unless `interval` is positive
NETDUT_API void check_poll_interval(std::chrono::milliseconds interval);

/// Call `producer` until it returns an engaged optional or `timeout` elapses.
///
/// The producer always runs at least once, even for a zero or negative
/// timeout. A timeout past the end of the steady clock waits indefinitely.
/// Between attempts the thread sleeps for `interval`, clipped so the
/// final attempt lands on the deadline. Exceptions from the producer
/// propagate immediately. Returns an empty optional on timeout.
template <typename Producer>
auto wait_for_value(Producer &&producer, std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval = DEFAULT_POLL_INTERVAL)
    -> decltype(producer()) {
  check_poll_interval(interval);

  using clock = std::chrono::steady_clock;
  using std::chrono::milliseconds;
  const auto start = clock::now();

  // Saturate instead of overflowing the clock's representation
  const auto headroom =
      std::chrono::duration_cast<milliseconds>(clock::time_point::max() - start);
  clock::time_point deadline = start;
  if (timeout >= headroom) {
    deadline = clock::time_point::max();
  } else if (timeout.count() > 0) {
    deadline = start + timeout;
  }
  size_t attempts = 0;

  while (true) {
    auto result = producer();
    ++attempts;
    if (result) {
      return result;
    }

    auto now = clock::now();
    if (now >= deadline) {
      LOG_DEBUG("POLLER", "TIMEOUT", "Condition not met after {} attempt(s) "
                "in {} ms", attempts, timeout.count());
      return {};
    }

    const auto remaining = deadline - now;
    if (interval < std::chrono::duration_cast<milliseconds>(remaining)) {
      std::this_thread::sleep_for(interval);
    } else {
      std::this_thread::sleep_for(remaining);
    }
  }
}

/// Wait until `predicate` returns true. Returns false when the deadline
/// passes first; timing out is an outcome for the caller to assert on, not
/// an error.
NETDUT_API bool
wait_for(const Predicate &predicate, std::chrono::milliseconds timeout,
         std::chrono::milliseconds interval = DEFAULT_POLL_INTERVAL);

/// wait_for with defaults carried from configuration
class NETDUT_API Poller {
public:
  explicit Poller(PollOptions options = {});

  bool wait(const Predicate &predicate) const;
  bool wait(const Predicate &predicate,
            std::chrono::milliseconds timeout) const;

  template <typename Producer>
  auto wait_value(Producer &&producer) const -> decltype(producer()) {
    return wait_for_value(std::forward<Producer>(producer), options_.timeout,
                          options_.interval);
  }

  const PollOptions &options() const { return options_; }

private:
  PollOptions options_;
};

} // namespace netdut
