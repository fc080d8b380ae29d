#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mxdiagram {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Parse a level name as accepted by the LOG_LEVEL environment variable
/// ("debug", "info", "warn"/"warning", "error"/"err", "off"; any case).
/// @return nullopt for an unknown name
std::optional<LogLevel> logLevelFromString(std::string_view name);

/// Minimum level requested through LOG_LEVEL, or fallback if unset/unknown
LogLevel logLevelFromEnvironment(LogLevel fallback = LogLevel::Info);

/**
 * @brief Destination for mxdiagram's diagnostics
 *
 * Implement this to route messages into the host application's logger
 * and install it with Logger::setBackend(). Backends filter by level
 * themselves; log() may be called from any thread.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param level Severity of the message
     * @param message Formatted text, prefixed with "File.cpp:line - "
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;
};

}  // namespace mxdiagram
