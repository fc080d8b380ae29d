#pragma once

#include "mxdiagram/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace mxdiagram {

/**
 * @brief Process-wide logging entry point used by the LOG_* macros
 *
 * Messages go to the installed backend. Until one is installed the
 * library falls back to SpdlogBackend (MXDIAGRAM_USE_SPDLOG=ON) or
 * DefaultBackend. Swapping the backend while other threads log is safe:
 * a call in flight keeps the backend it started with alive.
 *
 * Capture mode additionally keeps every message in memory, which tests
 * use to check what the library reported.
 */
class Logger {
public:
    /// Install a backend; nullptr restores the built-in default
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void enableCapture(bool enable);

    /**
     * @param pattern Keep only lines containing this text (empty = all)
     * @param maxLines Keep only the last maxLines matches (0 = all)
     */
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
};

}  // namespace mxdiagram

#define LOG_DEBUG(...) mxdiagram::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  mxdiagram::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  mxdiagram::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) mxdiagram::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
