#include "logger.hpp"

#include <cstring>

namespace scriptscene::core {

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    cfg_ = cfg;

    if (!cfg_.enabled) {
        return;
    }

    if (!cfg_.file.empty()) {
        file_ = std::fopen(cfg_.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[host][init][log] cannot open log file %s, using stderr only\n",
                         cfg_.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::enabled(LogLevel level, const char* tag) const {
    if (!cfg_.enabled) return false;
    if (static_cast<int>(level) < static_cast<int>(cfg_.level)) return false;
    if (!tag) return true;

    const auto it = cfg_.tags.find(tag);
    if (it == cfg_.tags.end()) {
        // Unknown tag: keep it if logging is enabled.
        return true;
    }
    return it->second;
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!enabled(level, tag)) return;

    char message[1024];
    va_list copy;
    va_copy(copy, args);
    std::vsnprintf(message, sizeof(message), fmt, copy);
    va_end(copy);

    const char* safeTag = tag ? tag : "-";

    if (level >= LogLevel::Warning) {
        std::fprintf(stderr, "[host][%llu][%s] %s: %s\n",
                     static_cast<unsigned long long>(tick_), safeTag, log_level_name(level), message);
    } else {
        std::fprintf(stderr, "[host][%llu][%s] %s\n",
                     static_cast<unsigned long long>(tick_), safeTag, message);
    }

    if (file_) {
        std::fprintf(file_, "[%s][%llu][%s] %s\n", log_level_name(level),
                     static_cast<unsigned long long>(tick_), safeTag, message);
        std::fflush(file_);
    }

    if (sink_) {
        sink_(level, safeTag, std::string_view(message, std::strlen(message)));
    }
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    auto& logger = Logger::instance();
    if (!logger.enabled(level, tag)) return;

    va_list args;
    va_start(args, fmt);
    logger.write(level, tag, fmt, args);
    va_end(args);
}

} // namespace scriptscene::core
