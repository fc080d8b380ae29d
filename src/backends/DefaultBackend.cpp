#include "mxdiagram/backends/DefaultBackend.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mxdiagram {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

LevelStyle styleFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"debug", "\033[36m"};
        case LogLevel::Info: return {"info", "\033[32m"};
        case LogLevel::Warn: return {"warning", "\033[33m"};
        case LogLevel::Error: return {"error", "\033[31m"};
        default: return {"off", ""};
    }
}

void writeTimestamp(std::ostream& out) {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    out << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // namespace

DefaultBackend::DefaultBackend(LogLevel minLevel) : minLevel_(minLevel) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    if (level < minLevel_ || level == LogLevel::Off) {
        return;
    }

    LevelStyle style = styleFor(level);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << '[';
    writeTimestamp(std::cout);
    std::cout << "] [" << style.color << style.name << "\033[0m] " << message << '\n';
}

}  // namespace mxdiagram
