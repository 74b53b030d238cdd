#pragma once
#include "mercury-itc/export.h"
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace mercuryitc {

/// Process-wide logging with component and operation context.
/// Messages logged before init() are dropped.
class MERCURY_ITC_API ClientLogger {
public:
  static ClientLogger &instance();

  // Console sink at info, rotating file sink at trace
  void init(const std::string &log_file = "mercury_itc.log",
            spdlog::level::level_enum level = spdlog::level::info);

  // Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown();

  bool is_initialized() const;

  template <typename... Args>
  void trace(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, operation, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ClientLogger() = default;

  ClientLogger(const ClientLogger &) = delete;
  ClientLogger &operator=(const ClientLogger &) = delete;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", component, operation);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, op, ...)                                          \
  mercuryitc::ClientLogger::instance().trace(component, op, __VA_ARGS__)
#define LOG_DEBUG(component, op, ...)                                          \
  mercuryitc::ClientLogger::instance().debug(component, op, __VA_ARGS__)
#define LOG_INFO(component, op, ...)                                           \
  mercuryitc::ClientLogger::instance().info(component, op, __VA_ARGS__)
#define LOG_WARN(component, op, ...)                                           \
  mercuryitc::ClientLogger::instance().warn(component, op, __VA_ARGS__)
#define LOG_ERROR(component, op, ...)                                          \
  mercuryitc::ClientLogger::instance().error(component, op, __VA_ARGS__)

} // namespace mercuryitc
