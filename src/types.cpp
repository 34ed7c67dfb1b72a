#include "netdut/types.hpp"

#include <sstream>

namespace netdut {

static std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

CommandLines split_commands(const std::string &text) {
  CommandLines lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

} // namespace netdut
