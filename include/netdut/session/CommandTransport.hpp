#pragma once
#include "netdut/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace netdut {

/// CommandTransport: sends CLI lines to one device and returns its raw
/// structured replies. Connection management belongs to the implementation.
class CommandTransport {
public:
  virtual ~CommandTransport() = default;

  /// Run one command line and return the device's reply
  virtual Response execute(const std::string &command) = 0;

  /// Run lines in order as one request; one reply per line, in order
  virtual std::vector<Response> execute_batch(const CommandLines &commands) = 0;

  /// Transport kind for logging ("eapi", "ssh", ...)
  virtual std::string transport_type() const = 0;

  /// Get connection info
  virtual std::string connection_info() const = 0;
};

using CommandTransportPtr = std::shared_ptr<CommandTransport>;

} // namespace netdut
