#include "netdut/translate/PatternMatcher.hpp"
#include "netdut/Errors.hpp"

#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace netdut {

ReplacementTemplate::ReplacementTemplate(const std::string &text)
    : text_(text) {
  std::string literal;

  auto flush = [&]() {
    if (!literal.empty()) {
      parts_.push_back({literal, std::nullopt});
      literal.clear();
    }
  };

  auto add_group = [&](size_t group) {
    flush();
    parts_.push_back({"", group});
    if (group > max_group_) {
      max_group_ = group;
    }
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c != '\\') {
      literal += c;
      continue;
    }

    if (i + 1 >= text.size()) {
      throw std::invalid_argument("replacement ends with a lone backslash");
    }

    char next = text[++i];
    if (std::isdigit(static_cast<unsigned char>(next))) {
      size_t group = static_cast<size_t>(next - '0');
      // At most two digits, \12 is group twelve
      if (i + 1 < text.size() &&
          std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
        group = group * 10 + static_cast<size_t>(text[++i] - '0');
      }
      add_group(group);
    } else if (next == 'g') {
      auto close = text.find('>', i + 1);
      if (i + 1 >= text.size() || text[i + 1] != '<' ||
          close == std::string::npos) {
        throw std::invalid_argument("missing < or > in \\g<N> reference");
      }
      std::string digits = text.substr(i + 2, close - i - 2);
      if (digits.empty() ||
          digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("bad group reference \\g<" + digits +
                                    ">");
      }
      if (digits.size() > 4) {
        throw std::invalid_argument("group number too large in \\g<" +
                                    digits + ">");
      }
      size_t group = 0;
      for (char d : digits) {
        group = group * 10 + static_cast<size_t>(d - '0');
      }
      add_group(group);
      i = close;
    } else if (next == '\\') {
      literal += '\\';
    } else if (next == 'n') {
      literal += '\n';
    } else if (next == 't') {
      literal += '\t';
    } else {
      throw std::invalid_argument(std::string("bad escape \\") + next);
    }
  }
  flush();
}

std::string ReplacementTemplate::expand(const std::smatch &match) const {
  std::string out;
  for (const auto &part : parts_) {
    if (part.group) {
      // Groups that did not participate expand to nothing
      out += match[*part.group].str();
    } else {
      out += part.literal;
    }
  }
  return out;
}

PatternMatcher::PatternMatcher(const std::string &dialect,
                               const RuleTable &rules)
    : dialect_(dialect), rules_(rules) {
  compiled_.reserve(rules_.size());

  for (size_t i = 0; i < rules_.size(); ++i) {
    const auto &rule = rules_[i];

    std::regex regex;
    try {
      regex = std::regex(rule.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &ex) {
      throw RuleCompileError(dialect_, i, rule.pattern, ex.what());
    }

    std::optional<ReplacementTemplate> replacement;
    try {
      replacement.emplace(rule.replacement);
    } catch (const std::invalid_argument &ex) {
      throw RuleCompileError(
          dialect_, i, rule.pattern,
          fmt::format("replacement '{}': {}", rule.replacement, ex.what()));
    }

    if (replacement->max_group() > regex.mark_count()) {
      throw RuleCompileError(
          dialect_, i, rule.pattern,
          fmt::format("replacement '{}' refers to group {} but the pattern "
                      "only has {}",
                      rule.replacement, replacement->max_group(),
                      regex.mark_count()));
    }

    compiled_.push_back({std::move(regex), std::move(*replacement)});
  }
}

void PatternMatcher::check_length(const std::string &line) const {
  if (line.size() > MAX_COMMAND_LENGTH) {
    throw CommandTooLongError(dialect_, line, MAX_COMMAND_LENGTH);
  }
}

std::optional<size_t> PatternMatcher::find(const std::string &line) const {
  check_length(line);
  std::smatch match;
  for (size_t i = 0; i < compiled_.size(); ++i) {
    if (std::regex_search(line, match, compiled_[i].regex,
                          std::regex_constants::match_continuous)) {
      return i;
    }
  }
  return std::nullopt;
}

std::string PatternMatcher::apply(const std::string &line) const {
  check_length(line);
  std::smatch match;
  for (const auto &rule : compiled_) {
    if (std::regex_search(line, match, rule.regex,
                          std::regex_constants::match_continuous)) {
      return rule.replacement.expand(match);
    }
  }
  return line;
}

} // namespace netdut
