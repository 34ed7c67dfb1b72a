#include "netdut/capability/CapabilityMatcher.hpp"
#include "netdut/Errors.hpp"

namespace netdut {

static std::regex compile_pattern(const std::string &pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error &ex) {
    throw InvalidPatternError(pattern, ex.what());
  }
}

CapabilityPattern::CapabilityPattern(const std::string &pattern)
    : pattern_(pattern), regex_(compile_pattern(pattern)) {}

bool CapabilityPattern::matches(const std::string &identifier) const {
  return std::regex_search(identifier, regex_);
}

bool matches(const std::string &identifier, const std::string &pattern) {
  return CapabilityPattern(pattern).matches(identifier);
}

} // namespace netdut
