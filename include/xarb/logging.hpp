// xarb - Logging
// Process-wide leveled logger with {fmt} formatting

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace xarb {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Critical = 4,
    Off = 5
};

inline constexpr const char* to_string(LogLevel l) noexcept {
    switch (l) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

// Throws ConfigError on an unknown name
LogLevel parse_log_level(std::string_view name);

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept { return level >= Logger::level(); }

    // Replace the stderr writer; an empty sink restores it
    static void set_sink(Sink sink);

    template <typename... Args>
    static void debug(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Debug, f, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Info, f, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Warn, f, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Error, f, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void critical(fmt::format_string<Args...> f, Args&&... args) {
        log(LogLevel::Critical, f, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    static void log(LogLevel lvl, fmt::format_string<Args...> f, Args&&... args) {
        if (!enabled(lvl)) return;
        write(lvl, fmt::format(f, std::forward<Args>(args)...));
    }

    static void write(LogLevel level, const std::string& message);
};

}  // namespace xarb
