#pragma once
#include "netdut/export.h"

#include <string>

namespace netdut {

/// Remove ANSI/VT100 escape sequences and carriage returns
NETDUT_API std::string strip_control_codes(const std::string &output);

/// Clean raw CLI output. Throws CliCommandError when a line starts with
/// "% ", which is how the device CLI reports a rejected command.
NETDUT_API std::string process_cli_output(const std::string &output);

/// Canonical spelling of a CLI line before it is written to a terminal:
/// trailing line endings removed and the "en" abbreviation expanded to
/// "enable" (its echo would not match otherwise).
NETDUT_API std::string normalize_cli_command(const std::string &command);

} // namespace netdut
