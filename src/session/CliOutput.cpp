#include "netdut/session/CliOutput.hpp"
#include "netdut/Errors.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace netdut {

std::string strip_control_codes(const std::string &output) {
  static const std::regex control_codes(R"(\x1B([@-_][0-?]*[ -/]*[@-~]|.))");

  std::string cleaned = std::regex_replace(output, control_codes, "");
  cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\r'),
                cleaned.end());
  return cleaned;
}

std::string process_cli_output(const std::string &output) {
  std::string cleaned = strip_control_codes(output);

  std::istringstream in(cleaned);
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind("% ", 0) == 0) {
      throw CliCommandError(line.substr(2), cleaned);
    }
  }
  return cleaned;
}

std::string normalize_cli_command(const std::string &command) {
  if (command == "en") {
    return "enable";
  }

  std::string out = command;
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
    out.pop_back();
  }
  return out;
}

} // namespace netdut
