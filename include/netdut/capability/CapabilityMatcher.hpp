#pragma once
#include "netdut/export.h"

#include <regex>
#include <string>

namespace netdut {

/// Precompiled device-type pattern.
///
/// Matching uses search semantics: the pattern may match anywhere in the
/// identifier, so "DCS-7130.*" accepts "DCS-7130-48L". Anchor with '^' for a
/// strict prefix.
class NETDUT_API CapabilityPattern {
public:
  /// Throws InvalidPatternError if `pattern` is not a valid regex
  explicit CapabilityPattern(const std::string &pattern);

  bool matches(const std::string &identifier) const;

  const std::string &pattern() const { return pattern_; }

private:
  std::string pattern_;
  std::regex regex_;
};

/// One-shot form of CapabilityPattern(pattern).matches(identifier)
NETDUT_API bool matches(const std::string &identifier,
                        const std::string &pattern);

} // namespace netdut
