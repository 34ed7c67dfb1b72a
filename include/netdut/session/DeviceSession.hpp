#pragma once
#include "netdut/export.h"
#include "netdut/session/CommandTransport.hpp"
#include "netdut/translate/Translator.hpp"
#include "netdut/types.hpp"

#include <string>
#include <vector>

namespace netdut {

/// One device connection as seen by a test: canonical commands go in,
/// canonical replies come out.
///
/// The session owns the choice of dialect and translator for its device.
/// Without a translator commands and replies pass through untouched.
class NETDUT_API DeviceSession {
public:
  /// Throws ConfigurationError for a null transport and UnknownDialectError
  /// when `translator` cannot handle `dialect`
  DeviceSession(CommandTransportPtr transport, std::string dialect,
                TranslatorPtr translator = nullptr);

  /// Swap the translator used for later calls. Passing nullptr disables
  /// translation. Throws UnknownDialectError if the translator does not
  /// support this session's dialect.
  void set_translator(TranslatorPtr translator);

  /// Run one command and return its (normalized) reply
  Response send_command(const std::string &command, bool translate = true);

  /// Run several commands as one batch; one reply per command
  std::vector<Response> send_commands(const CommandLines &commands,
                                      bool translate = true);

  /// send_commands for a newline separated block of commands
  std::vector<Response> send_block(const std::string &block,
                                   bool translate = true);

  const std::string &dialect() const { return dialect_; }
  const TranslatorPtr &translator() const { return translator_; }
  CommandTransport &transport() const { return *transport_; }

private:
  bool translating(bool requested) const {
    return requested && translator_ != nullptr;
  }

  CommandTransportPtr transport_;
  std::string dialect_;
  TranslatorPtr translator_;
};

} // namespace netdut
