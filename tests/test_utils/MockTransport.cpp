#include "MockTransport.hpp"
#include "netdut/Errors.hpp"

namespace netdut {
namespace test {

void MockTransport::set_response(const std::string &command,
                                 const Response &response) {
  std::lock_guard lock(mutex_);
  responses_[command] = response;
}

void MockTransport::set_default_response(const Response &response) {
  std::lock_guard lock(mutex_);
  default_response_ = response;
}

void MockTransport::set_error(const std::string &command,
                              const std::string &error) {
  std::lock_guard lock(mutex_);
  errors_[command] = error;
}

void MockTransport::set_batch_reply_count(size_t count) {
  std::lock_guard lock(mutex_);
  batch_reply_count_ = count;
}

std::vector<std::string> MockTransport::get_command_history() const {
  std::lock_guard lock(mutex_);
  return command_history_;
}

std::vector<CommandLines> MockTransport::get_batch_history() const {
  std::lock_guard lock(mutex_);
  return batch_history_;
}

size_t MockTransport::command_count() const {
  std::lock_guard lock(mutex_);
  return command_history_.size();
}

void MockTransport::clear_history() {
  std::lock_guard lock(mutex_);
  command_history_.clear();
  batch_history_.clear();
}

// Caller holds mutex_
Response MockTransport::reply_for(const std::string &command) {
  command_history_.push_back(command);

  if (errors_.count(command)) {
    throw TransportError(errors_[command]);
  }
  auto it = responses_.find(command);
  if (it != responses_.end()) {
    return it->second;
  }
  return default_response_;
}

Response MockTransport::execute(const std::string &command) {
  std::lock_guard lock(mutex_);
  return reply_for(command);
}

std::vector<Response> MockTransport::execute_batch(const CommandLines &commands) {
  std::lock_guard lock(mutex_);
  batch_history_.push_back(commands);

  std::vector<Response> replies;
  for (const auto &command : commands) {
    replies.push_back(reply_for(command));
  }

  if (batch_reply_count_) {
    replies.resize(*batch_reply_count_, Response::object());
  }
  return replies;
}

} // namespace test
} // namespace netdut
