#include "netdut/session/DeviceSession.hpp"
#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"

#include <fmt/format.h>

namespace netdut {

DeviceSession::DeviceSession(CommandTransportPtr transport,
                             std::string dialect, TranslatorPtr translator)
    : transport_(std::move(transport)), dialect_(std::move(dialect)) {
  if (!transport_) {
    throw ConfigurationError("DeviceSession requires a transport");
  }
  set_translator(std::move(translator));

  LOG_INFO("SESSION", dialect_, "Session over {} ({})",
           transport_->transport_type(), transport_->connection_info());
}

void DeviceSession::set_translator(TranslatorPtr translator) {
  if (translator && !translator->supports(dialect_)) {
    throw UnknownDialectError(dialect_);
  }
  translator_ = std::move(translator);

  if (translator_) {
    LOG_DEBUG("SESSION", dialect_, "Translator set (native '{}')",
              translator_->native_dialect());
  } else {
    LOG_DEBUG("SESSION", dialect_, "Translation disabled");
  }
}

Response DeviceSession::send_command(const std::string &command,
                                     bool translate) {
  if (!translating(translate)) {
    return transport_->execute(command);
  }

  auto device_command = translator_->translate_command(dialect_, command);
  auto reply = transport_->execute(device_command);
  return translator_->translate_response(dialect_, reply);
}

std::vector<Response> DeviceSession::send_commands(const CommandLines &commands,
                                                   bool translate) {
  CommandLines device_commands = commands;
  if (translating(translate)) {
    device_commands = translator_->translate_commands(dialect_, commands);
  }

  LOG_INFO("SESSION", dialect_, "Sending {} command(s)",
           device_commands.size());
  auto replies = transport_->execute_batch(device_commands);

  if (replies.size() != device_commands.size()) {
    throw TransportError(
        fmt::format("{} transport returned {} replies for {} commands",
                    transport_->transport_type(), replies.size(),
                    device_commands.size()));
  }

  if (translating(translate)) {
    for (auto &reply : replies) {
      reply = translator_->translate_response(dialect_, reply);
    }
  }
  return replies;
}

std::vector<Response> DeviceSession::send_block(const std::string &block,
                                                bool translate) {
  return send_commands(split_commands(block), translate);
}

} // namespace netdut
