#pragma once

#include "mxdiagram/common/ILoggerBackend.h"
#include <mutex>

namespace mxdiagram {

/**
 * @brief stdout backend with no external dependencies
 *
 * Writes "[HH:MM:SS.mmm] [level] message" with ANSI level colours.
 * Used when the library is built with MXDIAGRAM_USE_SPDLOG=OFF.
 */
class DefaultBackend : public ILoggerBackend {
public:
    /// @param minLevel Messages below this level are dropped
    explicit DefaultBackend(LogLevel minLevel = logLevelFromEnvironment());

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;

private:
    LogLevel minLevel_;
    std::mutex mutex_;
};

}  // namespace mxdiagram
