#include "netdut/translate/Translator.hpp"
#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace netdut {

Translator::Translator(std::string native_dialect,
                       const std::map<std::string, RuleTable> &tables,
                       KeyTransform transform, CollisionPolicy policy)
    : native_dialect_(std::move(native_dialect)),
      normalizer_(std::move(transform), policy) {
  if (native_dialect_.empty()) {
    throw ConfigurationError("Native dialect name must not be empty");
  }

  for (const auto &[name, rules] : tables) {
    if (name.empty()) {
      throw ConfigurationError("Dialect name must not be empty");
    }
    if (name == native_dialect_) {
      throw ConfigurationError(
          fmt::format("Cannot register rules for the native dialect '{}'",
                      native_dialect_));
    }
    matchers_.emplace(name, PatternMatcher(name, rules));
  }

  LOG_DEBUG("TRANSLATOR", "CREATE",
            "Translator for native '{}' with {} dialect(s), collisions: {}",
            native_dialect_, matchers_.size(), to_string(policy));
}

const PatternMatcher &
Translator::matcher_for(const std::string &dialect) const {
  auto it = matchers_.find(dialect);
  if (it == matchers_.end()) {
    throw UnknownDialectError(dialect);
  }
  return it->second;
}

CommandLines Translator::translate_commands(const std::string &dialect,
                                            const CommandLines &commands) const {
  if (dialect == native_dialect_) {
    return commands;
  }

  const auto &matcher = matcher_for(dialect);

  CommandLines translated;
  translated.reserve(commands.size());
  for (const auto &command : commands) {
    translated.push_back(matcher.apply(command));
  }

  if (translated != commands) {
    LOG_DEBUG("TRANSLATOR", dialect, "Before: {}, After: {}", commands,
              translated);
  }
  return translated;
}

std::string Translator::translate_command(const std::string &dialect,
                                          const std::string &command) const {
  if (dialect == native_dialect_) {
    return command;
  }
  return matcher_for(dialect).apply(command);
}

Response Translator::translate_response(const std::string &dialect,
                                        const Response &response) const {
  if (dialect == native_dialect_) {
    return response;
  }
  // Unregistered dialects are rejected even though normalization does not
  // use the rule table
  matcher_for(dialect);
  return normalizer_.normalize(response);
}

bool Translator::supports(const std::string &dialect) const {
  return dialect == native_dialect_ || matchers_.count(dialect) > 0;
}

std::vector<std::string> Translator::dialects() const {
  std::vector<std::string> names;
  names.reserve(matchers_.size());
  for (const auto &[name, _] : matchers_) {
    names.push_back(name);
  }
  return names;
}

const RuleTable &Translator::rules(const std::string &dialect) const {
  return matcher_for(dialect).rules();
}

TranslatorBuilder &TranslatorBuilder::native_dialect(const std::string &dialect) {
  native_dialect_ = dialect;
  return *this;
}

TranslatorBuilder &TranslatorBuilder::set_rules(const std::string &dialect,
                                                RuleTable rules) {
  tables_[dialect] = std::move(rules);
  return *this;
}

TranslatorBuilder &TranslatorBuilder::prepend_rules(const std::string &dialect,
                                                    const RuleTable &rules) {
  auto &table = tables_[dialect];
  table.insert(table.begin(), rules.begin(), rules.end());
  return *this;
}

TranslatorBuilder &TranslatorBuilder::append_rules(const std::string &dialect,
                                                   const RuleTable &rules) {
  auto &table = tables_[dialect];
  table.insert(table.end(), rules.begin(), rules.end());
  return *this;
}

TranslatorBuilder &TranslatorBuilder::key_transform(KeyTransform transform) {
  transform_ = std::move(transform);
  return *this;
}

TranslatorBuilder &TranslatorBuilder::collision_policy(CollisionPolicy policy) {
  policy_ = policy;
  return *this;
}

TranslatorPtr TranslatorBuilder::build() const {
  return std::make_shared<const Translator>(native_dialect_, tables_,
                                            transform_, policy_);
}

} // namespace netdut
