#pragma once
#include "netdut/export.h"
#include "netdut/types.hpp"

#include <string>

namespace netdut {

/// Build a DeviceIdentity from the text of "show version".
///
/// The SKU is the first "DCS-7..." token run to the end of its line. MOS
/// output has no "Hardware version:" field, which is how the dialect is told
/// apart. Throws Error when no SKU is present.
NETDUT_API DeviceIdentity parse_show_version(const std::string &output);

/// Build a DeviceIdentity from a structured "show version" reply. Accepts
/// either key convention (modelName or model_name). Throws Error when the
/// reply carries no model name.
NETDUT_API DeviceIdentity identity_from_version_reply(const Response &reply,
                                                      const std::string &dialect);

} // namespace netdut
