#include "mercury-itc/Logger.hpp"
#include <vector>

namespace mercuryitc {

// DLL-safe singleton implementation
ClientLogger &ClientLogger::instance() {
  static ClientLogger logger;
  return logger;
}

void ClientLogger::init(const std::string &log_file,
                        spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);

  // If already initialized, just update level
  if (logger_) {
    logger_->set_level(level);
    logger_->flush_on(level);
    return;
  }

  try {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);
      sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("mercury_itc", sinks.begin(),
                                               sinks.end());
    logger_->set_level(level);
    logger_->flush_on(level);

    if (!spdlog::get("mercury_itc")) {
      spdlog::register_logger(logger_);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
  }
}

void ClientLogger::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  spdlog::drop("mercury_itc");
  logger_.reset();
}

bool ClientLogger::is_initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logger_ != nullptr;
}

} // namespace mercuryitc
