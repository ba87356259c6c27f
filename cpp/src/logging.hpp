#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace ocr_structured {

// Shared "ocr_structured" logger (stderr, colour). Level comes from SPDLOG_LEVEL, default warn.
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace ocr_structured
