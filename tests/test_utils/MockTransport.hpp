#pragma once
#include "netdut/session/CommandTransport.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netdut {
namespace test {

/// Scripted transport: replies are looked up by the exact command line the
/// device would receive, and every line is recorded.
class MockTransport : public CommandTransport {
public:
  MockTransport() = default;

  void set_response(const std::string &command, const Response &response);
  void set_default_response(const Response &response);
  void set_error(const std::string &command, const std::string &error);

  /// Make execute_batch return `count` replies no matter how many lines
  void set_batch_reply_count(size_t count);

  std::vector<std::string> get_command_history() const;
  std::vector<CommandLines> get_batch_history() const;
  size_t command_count() const;
  void clear_history();

  Response execute(const std::string &command) override;
  std::vector<Response> execute_batch(const CommandLines &commands) override;
  std::string transport_type() const override { return "mock"; }
  std::string connection_info() const override { return "mock://dut"; }

private:
  Response reply_for(const std::string &command);

  mutable std::mutex mutex_;
  std::vector<std::string> command_history_;
  std::vector<CommandLines> batch_history_;
  std::map<std::string, Response> responses_;
  std::map<std::string, std::string> errors_;
  Response default_response_ = Response::object();
  std::optional<size_t> batch_reply_count_;
};

} // namespace test
} // namespace netdut
