#pragma once

#include "logger.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace scriptscene::core {

struct SandboxSettings {
    std::size_t max_memory_mb{32};
    std::size_t max_instructions_per_call{5000000};
    double max_execution_time_sec{2.0};
};

struct MemorySettings {
    // Initial and maximum size of each environment's guest heap.
    std::uint32_t guest_heap_bytes{64 * 1024};
    std::uint32_t guest_heap_limit_bytes{16 * 1024 * 1024};

    // Caps applied while decoding parameter blocks.
    std::uint32_t max_string_bytes{64 * 1024};
    std::uint32_t max_array_items{4096};
};

struct HostSettings {
    float tick_rate{30.0f};
    int ticks{300};
};

struct HostConfig {
    LoggingConfig logging{};
    SandboxSettings sandbox{};
    MemorySettings memory{};
    HostSettings host{};
};

// INI-style loader: [section] headers, key = value lines, # and ; comments.
// Unknown sections/keys are ignored and malformed values keep their defaults.
class ConfigLoader {
public:
    explicit ConfigLoader(HostConfig& config) : config_(config) {}

    bool load_from_file(const std::string& path, std::string* outError);
    void load_from_stream(std::istream& in);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

private:
    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static std::uint32_t parse_u32(const std::string& v, std::uint32_t default_value);
    static float parse_float(const std::string& v, float default_value);
    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);

    HostConfig& config_;
    std::string loaded_from_path_{};
};

} // namespace scriptscene::core
