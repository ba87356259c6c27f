#include "logging.hpp"

#include "ocr_structured.hpp"

#include <mutex>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ocr_structured {

static constexpr const char* kLoggerName = "ocr_structured";

std::shared_ptr<spdlog::logger> get_logger() {
  // Survives spdlog::drop_all() in the host.
  static std::shared_ptr<spdlog::logger> logger;
  static std::once_flag once;
  std::call_once(once, [] {
    logger = spdlog::get(kLoggerName);
    if (logger) return;
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_level(spdlog::level::warn);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=ocr_structured=trace
    spdlog::cfg::load_env_levels();
  });
  return logger;
}

void set_log_level(const std::string& level) { get_logger()->set_level(spdlog::level::from_str(level)); }

}  // namespace ocr_structured
