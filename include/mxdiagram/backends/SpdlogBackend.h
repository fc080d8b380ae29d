#pragma once

#include "mxdiagram/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace mxdiagram {

/**
 * @brief Backend writing to the "mxdiagram" spdlog logger
 *
 * If the host already registered a logger under that name (for example
 * with its own file sinks) it is reused as-is; otherwise a coloured
 * stdout logger is created. Default backend when MXDIAGRAM_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    /// @param minLevel Level applied to a newly created logger
    explicit SpdlogBackend(LogLevel minLevel = logLevelFromEnvironment());

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mxdiagram
