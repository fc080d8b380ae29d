#include "mxdiagram/backends/SpdlogBackend.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mxdiagram {

namespace {

constexpr const char* kLoggerName = "mxdiagram";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        default: return spdlog::level::off;
    }
}

}  // namespace

SpdlogBackend::SpdlogBackend(LogLevel minLevel) {
    logger_ = spdlog::get(kLoggerName);
    if (!logger_) {
        logger_ = spdlog::stdout_color_mt(kLoggerName);
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        logger_->set_level(toSpdlog(minLevel));
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(toSpdlog(level), message);
}

}  // namespace mxdiagram
