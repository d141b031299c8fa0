#pragma once

#include "types.hpp"

#include <cstdarg>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace scriptscene::core {

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};

    // Per-tag switches. Tags not listed here are enabled.
    std::unordered_map<std::string, bool> tags{};
};

// Receives every line that passes the level and tag filters.
using LogSink = std::function<void(LogLevel level, std::string_view tag, std::string_view message)>;

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, tag switches, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    // Tick number printed in the line prefix.
    void set_tick(Tick tick) { tick_ = tick; }

    // Extra sink (tests capture diagnostics through this). Pass nullptr to remove.
    void set_sink(LogSink sink) { sink_ = std::move(sink); }

    bool enabled(LogLevel level, const char* tag) const;

    void write(LogLevel level, const char* tag, const char* fmt, va_list args);

private:
    Logger() = default;

    LoggingConfig cfg_{};
    std::FILE* file_{nullptr};
    LogSink sink_{};
    Tick tick_{0};
};

// printf-style tagged logging: "[host][<tick>][<tag>] message".
void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace scriptscene::core
