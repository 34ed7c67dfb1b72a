#include "netdut/poll/Poller.hpp"
#include "netdut/Errors.hpp"

namespace netdut {

void check_poll_interval(std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    throw ConfigurationError("Poll interval must be positive, got " +
                             std::to_string(interval.count()) + " ms");
  }
}

bool wait_for(const Predicate &predicate, std::chrono::milliseconds timeout,
              std::chrono::milliseconds interval) {
  auto result = wait_for_value(
      [&predicate]() -> std::optional<bool> {
        if (predicate()) {
          return true;
        }
        return std::nullopt;
      },
      timeout, interval);
  return result.has_value();
}

Poller::Poller(PollOptions options) : options_(options) {
  check_poll_interval(options_.interval);
}

bool Poller::wait(const Predicate &predicate) const {
  return wait_for(predicate, options_.timeout, options_.interval);
}

bool Poller::wait(const Predicate &predicate,
                  std::chrono::milliseconds timeout) const {
  return wait_for(predicate, timeout, options_.interval);
}

} // namespace netdut
