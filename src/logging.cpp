// xarb - Logging Implementation

#include <xarb/logging.hpp>
#include <xarb/errors.hpp>
#include <xarb/types.hpp>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace xarb {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;
Logger::Sink g_sink;

}  // namespace

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug" || name == "trace") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    throw ConfigError("Unknown log level: " + std::string(name));
}

void Logger::set_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_release);
}

LogLevel Logger::level() noexcept {
    return g_level.load(std::memory_order_acquire);
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_sink = std::move(sink);
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (g_sink) {
        g_sink(level, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto ms = now_ms() % 1000;
    fmt::print(stderr, "[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] {}\n",
               fmt::gmtime(std::chrono::system_clock::to_time_t(now)),
               ms, to_string(level), message);
}

}  // namespace xarb
