#include "netdut/Logger.hpp"
#include "netdut/Errors.hpp"

namespace netdut {

// DLL-safe singleton implementation
SessionLogger &SessionLogger::instance() {
  static SessionLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  throw ConfigurationError("Unknown log level: '" + level + "'");
}

} // namespace netdut
