#pragma once
#include "netdut/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace netdut {

/// Centralized logging with component and context prefixes
class NETDUT_API SessionLogger {
public:
  static SessionLogger &instance();

  /// Start logging to stderr, and to a rotating `log_file` when one is named.
  /// A second call only changes the level.
  void init(const std::string &log_file = "netdut.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      std::vector<spdlog::sink_ptr> sinks;
      sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      sinks.back()->set_level(spdlog::level::info);

      if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1024 * 1024 * 10, 3)); // 10MB, 3 files
        sinks.back()->set_level(spdlog::level::trace);
      }

      logger_ = std::make_shared<spdlog::logger>("netdut", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  SessionLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &context, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [context] message
    std::string prefix = fmt::format("[{}] [{}] ", component, context);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

/// Map a level name ("trace", "debug", "info", "warn", "error", "off").
/// Throws ConfigurationError for anything else.
NETDUT_API spdlog::level::level_enum parse_log_level(const std::string &level);

// Convenience macros
#define LOG_DEBUG(component, ctx, ...)                                         \
  netdut::SessionLogger::instance().debug(component, ctx, __VA_ARGS__)
#define LOG_INFO(component, ctx, ...)                                          \
  netdut::SessionLogger::instance().info(component, ctx, __VA_ARGS__)
#define LOG_WARN(component, ctx, ...)                                          \
  netdut::SessionLogger::instance().warn(component, ctx, __VA_ARGS__)

} // namespace netdut
