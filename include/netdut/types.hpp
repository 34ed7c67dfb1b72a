#pragma once
#include "netdut/export.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netdut {

/// Command/response convention names
namespace dialect {
inline constexpr const char *EOS = "eos";
inline constexpr const char *MOS = "mos";
} // namespace dialect

/// Ordered CLI lines; each line runs in the context left by the previous one
using CommandLines = std::vector<std::string>;

/// Structured device reply (mapping, sequence or scalar)
using Response = nlohmann::json;

/// One translation rule. `pattern` is an ECMAScript regex matched against the
/// start of a command line; `replacement` may reference groups as \1 or \g<1>.
struct Rule {
  std::string pattern;
  std::string replacement;
};

/// Ordered rules for one dialect. First match wins.
using RuleTable = std::vector<Rule>;

/// What a device reports about itself
struct DeviceIdentity {
  std::string sku; // e.g. "DCS-7130-48L"
  std::string dialect;
  std::optional<std::string> serial;
  std::optional<std::string> micro_version;
};

/// Split a newline separated command block into trimmed, non-empty lines
NETDUT_API CommandLines split_commands(const std::string &text);

} // namespace netdut
