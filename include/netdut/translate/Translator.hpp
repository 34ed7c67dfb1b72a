#pragma once
#include "netdut/export.h"
#include "netdut/translate/KeyNormalizer.hpp"
#include "netdut/translate/PatternMatcher.hpp"
#include "netdut/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netdut {

/// Translator: hides command syntax and result key differences between
/// devices speaking different dialects.
///
/// Holds one rule table per non-native dialect and one key transform. All
/// rules are compiled on construction; the object is immutable afterwards and
/// safe to share between sessions.
class NETDUT_API Translator {
public:
  /// Throws RuleCompileError for a bad rule and ConfigurationError when a
  /// table is registered for the native dialect or under an empty name.
  Translator(std::string native_dialect,
             const std::map<std::string, RuleTable> &tables,
             KeyTransform transform = camel_to_snake,
             CollisionPolicy policy = CollisionPolicy::Fail);

  /// Rewrite canonical command lines into lines `dialect` understands.
  /// Identity for the native dialect; UnknownDialectError for a dialect
  /// without a rule table.
  CommandLines translate_commands(const std::string &dialect,
                                  const CommandLines &commands) const;

  /// Single line form of translate_commands
  std::string translate_command(const std::string &dialect,
                                const std::string &command) const;

  /// Rename the keys of a device reply into the canonical convention.
  /// Identity for the native dialect; UnknownDialectError for a dialect
  /// without a rule table; KeyCollisionError under CollisionPolicy::Fail.
  Response translate_response(const std::string &dialect,
                              const Response &response) const;

  /// True for the native dialect and for every registered dialect
  bool supports(const std::string &dialect) const;

  const std::string &native_dialect() const { return native_dialect_; }

  /// Registered non-native dialects, sorted
  std::vector<std::string> dialects() const;

  /// Rule table of a registered dialect (throws UnknownDialectError)
  const RuleTable &rules(const std::string &dialect) const;

  const KeyNormalizer &normalizer() const { return normalizer_; }

private:
  const PatternMatcher &matcher_for(const std::string &dialect) const;

  std::string native_dialect_;
  std::map<std::string, PatternMatcher> matchers_;
  KeyNormalizer normalizer_;
};

using TranslatorPtr = std::shared_ptr<const Translator>;

/// Builds Translators by composing rule tables. Caller rules can be layered
/// before a dialect's table (so they take precedence) or after it (so they
/// only catch lines the table leaves alone).
class NETDUT_API TranslatorBuilder {
public:
  TranslatorBuilder() = default;

  TranslatorBuilder &native_dialect(const std::string &dialect);

  /// Replace the whole table of `dialect`
  TranslatorBuilder &set_rules(const std::string &dialect, RuleTable rules);

  TranslatorBuilder &prepend_rules(const std::string &dialect,
                                   const RuleTable &rules);
  TranslatorBuilder &append_rules(const std::string &dialect,
                                  const RuleTable &rules);

  TranslatorBuilder &key_transform(KeyTransform transform);
  TranslatorBuilder &collision_policy(CollisionPolicy policy);

  /// Compile everything; throws the same errors as the Translator ctor
  TranslatorPtr build() const;

private:
  std::string native_dialect_{dialect::EOS};
  std::map<std::string, RuleTable> tables_;
  KeyTransform transform_{camel_to_snake};
  CollisionPolicy policy_{CollisionPolicy::Fail};
};

} // namespace netdut
