#pragma once
#include "netdut/export.h"
#include "netdut/poll/Poller.hpp"
#include "netdut/translate/KeyNormalizer.hpp"
#include "netdut/translate/Translator.hpp"
#include "netdut/types.hpp"

#include <map>
#include <string>

namespace netdut {

/// Caller rules wrapped around one dialect's table
struct RuleLayer {
  RuleTable prepend; // tried before the dialect's own rules
  RuleTable append;  // tried after them
};

/// Session settings, usually loaded from YAML:
///
///   dialect: mos
///   native_dialect: eos
///   log_level: debug
///   log_file: netdut.log            # "" logs to stderr only
///   collision_policy: fail          # or last_write_wins
///   poll:
///     timeout_ms: 30000
///     interval_ms: 100
///   rules:
///     mos:
///       prepend:
///         - pattern: "show interfaces (\\S+) status"
///           replacement: "show interface \\1"
///       append: []
struct NETDUT_API SessionConfig {
  std::string dialect{netdut::dialect::EOS};
  std::string native_dialect{netdut::dialect::EOS};
  std::string log_level{"info"};
  std::string log_file{"netdut.log"};
  CollisionPolicy collision_policy{CollisionPolicy::Fail};
  PollOptions poll;
  std::map<std::string, RuleLayer> rules;

  /// Throws ConfigurationError naming the offending path on bad input
  static SessionConfig from_file(const std::string &yaml_path);
  static SessionConfig from_yaml(const std::string &yaml_text);
};

/// Shipped tables with the configured layers applied. Throws
/// UnknownDialectError if the configured session dialect ends up unsupported.
NETDUT_API TranslatorPtr build_translator(const SessionConfig &config);

/// Start the process logger with the configured file and level
NETDUT_API void init_logging(const SessionConfig &config);

} // namespace netdut
