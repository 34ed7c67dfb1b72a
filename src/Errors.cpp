#include "netdut/Errors.hpp"

#include <fmt/format.h>

namespace netdut {

RuleCompileError::RuleCompileError(const std::string &dialect, size_t index,
                                   const std::string &pattern,
                                   const std::string &reason)
    : ConfigurationError(
          fmt::format("Invalid rule #{} for dialect '{}' (pattern '{}'): {}",
                      index, dialect, pattern, reason)),
      dialect_(dialect), index_(index), pattern_(pattern) {}

UnknownDialectError::UnknownDialectError(const std::string &dialect)
    : ConfigurationError(
          fmt::format("No rule table registered for dialect '{}'", dialect)),
      dialect_(dialect) {}

KeyCollisionError::KeyCollisionError(const std::string &path,
                                     const std::string &first_key,
                                     const std::string &second_key,
                                     const std::string &normalized_key)
    : ConfigurationError(fmt::format(
          "Keys '{}' and '{}' at '{}' both normalize to '{}'", first_key,
          second_key, path.empty() ? "/" : path, normalized_key)),
      path_(path), normalized_key_(normalized_key) {}

CommandTooLongError::CommandTooLongError(const std::string &dialect,
                                         const std::string &line,
                                         size_t limit)
    : Error(fmt::format("Command for dialect '{}' is {} characters long, "
                        "limit is {}: '{}...'",
                        dialect, line.size(), limit, line.substr(0, 40))),
      length_(line.size()), limit_(limit) {}

InvalidPatternError::InvalidPatternError(const std::string &pattern,
                                         const std::string &reason)
    : ConfigurationError(
          fmt::format("Invalid capability pattern '{}': {}", pattern, reason)),
      pattern_(pattern) {}

} // namespace netdut
