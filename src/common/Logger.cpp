#include "mxdiagram/common/Logger.h"

#ifdef MXDIAGRAM_USE_SPDLOG
#include "mxdiagram/backends/SpdlogBackend.h"
#else
#include "mxdiagram/backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <mutex>

namespace mxdiagram {

namespace {

std::mutex backendMutex;
std::shared_ptr<ILoggerBackend> activeBackend;

std::mutex captureMutex;
bool captureEnabled = false;
std::vector<std::string> capturedLines;

std::shared_ptr<ILoggerBackend> makeDefaultBackend() {
#ifdef MXDIAGRAM_USE_SPDLOG
    return std::make_shared<SpdlogBackend>();
#else
    return std::make_shared<DefaultBackend>();
#endif
}

/// Snapshot of the installed backend; the caller's copy outlives a concurrent setBackend()
std::shared_ptr<ILoggerBackend> currentBackend() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!activeBackend) {
        activeBackend = makeDefaultBackend();
    }
    return activeBackend;
}

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Error: return "[error] ";
        default: return "";
    }
}

std::string callSite(const std::source_location& loc) {
    std::string_view file = loc.file_name();
    size_t slash = file.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }
    return std::string(file) + ":" + std::to_string(loc.line());
}

}  // namespace

std::optional<LogLevel> logLevelFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "err" || lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

LogLevel logLevelFromEnvironment(LogLevel fallback) {
    const char* value = std::getenv("LOG_LEVEL");
    if (!value) {
        return fallback;
    }
    return logLevelFromString(value).value_or(fallback);
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::shared_ptr<ILoggerBackend> previous;
    {
        std::lock_guard<std::mutex> lock(backendMutex);
        previous = std::move(activeBackend);
        activeBackend = std::move(backend);
    }
    // previous is released outside the lock, after any in-flight copies
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    std::string line = callSite(loc) + " - " + message;

    std::shared_ptr<ILoggerBackend> backend = currentBackend();
    backend->log(level, line, loc);

    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        capturedLines.push_back(levelTag(level) + line);
    }
}

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    std::copy_if(capturedLines.begin(), capturedLines.end(), std::back_inserter(result),
                 [&pattern](const std::string& line) {
                     return pattern.empty() || line.find(pattern) != std::string::npos;
                 });

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLines.clear();
}

}  // namespace mxdiagram
