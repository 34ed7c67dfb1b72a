#pragma once
#include "netdut/export.h"
#include "netdut/types.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace netdut {

/// Longest command line PatternMatcher will run its rules against.
/// std::regex matching recurses once per character consumed.
inline constexpr size_t MAX_COMMAND_LENGTH = 4096;

/// Replacement template split into literal text and capture group references.
/// Supports \N, \NN and \g<N> group references, \\ for a backslash and the
/// \n and \t escapes.
class NETDUT_API ReplacementTemplate {
public:
  /// Throws std::invalid_argument describing the first bad escape
  explicit ReplacementTemplate(const std::string &text);

  std::string expand(const std::smatch &match) const;

  /// Highest group number referenced (0 if none)
  size_t max_group() const { return max_group_; }

  const std::string &text() const { return text_; }

private:
  struct Part {
    std::string literal;
    std::optional<size_t> group;
  };

  std::string text_;
  std::vector<Part> parts_;
  size_t max_group_{0};
};

/// Applies an ordered rule table to single command lines.
///
/// A rule matches when its pattern matches a prefix of the line (the match is
/// anchored at the first character but not at the end). The first matching
/// rule wins and the line is replaced by the expanded replacement template.
/// Lines no rule matches are returned unchanged.
class NETDUT_API PatternMatcher {
public:
  /// Compiles every rule. Throws RuleCompileError on the first rule whose
  /// pattern is not a valid regex or whose replacement is malformed.
  PatternMatcher(const std::string &dialect, const RuleTable &rules);

  /// Index of the first rule matching `line`. Throws CommandTooLongError
  /// for lines longer than MAX_COMMAND_LENGTH.
  std::optional<size_t> find(const std::string &line) const;

  /// Translated line, or `line` itself when nothing matches. Same length
  /// limit as find().
  std::string apply(const std::string &line) const;

  const std::string &dialect() const { return dialect_; }
  const RuleTable &rules() const { return rules_; }
  size_t size() const { return rules_.size(); }

private:
  void check_length(const std::string &line) const;

  struct CompiledRule {
    std::regex regex;
    ReplacementTemplate replacement;
  };

  std::string dialect_;
  RuleTable rules_;
  std::vector<CompiledRule> compiled_;
};

} // namespace netdut
