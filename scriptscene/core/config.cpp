#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace scriptscene::core {

std::string ConfigLoader::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string ConfigLoader::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string ConfigLoader::strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool ConfigLoader::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int ConfigLoader::parse_int(const std::string& v, int default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

std::uint32_t ConfigLoader::parse_u32(const std::string& v, std::uint32_t default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        if (!s.empty() && s.front() == '-') return default_value;
        unsigned long long out = std::stoull(s, &idx, 10);
        if (idx != s.size() || out > 0xFFFFFFFFull) return default_value;
        return static_cast<std::uint32_t>(out);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

float ConfigLoader::parse_float(const std::string& v, float default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        float out = std::stof(s, &idx);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

LogLevel ConfigLoader::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    const int n = parse_int(s, -1);
    if (n >= 0 && n <= static_cast<int>(LogLevel::Error)) {
        return static_cast<LogLevel>(n);
    }
    return default_value;
}

void ConfigLoader::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        auto& logging = config_.logging;
        if (k == "enabled") logging.enabled = parse_bool(v, logging.enabled);
        else if (k == "level") logging.level = log_level_from_string(v, logging.level);
        else if (k == "file") logging.file = v;
        else if (k.rfind("tags.", 0) == 0 && k.size() > 5) {
            const std::string tag = k.substr(5);
            const auto it = logging.tags.find(tag);
            logging.tags[tag] = parse_bool(v, it == logging.tags.end() ? true : it->second);
        }
        return;
    }

    if (sec == "sandbox") {
        auto& sandbox = config_.sandbox;
        if (k == "max_memory_mb") sandbox.max_memory_mb = parse_u32(v, static_cast<std::uint32_t>(sandbox.max_memory_mb));
        else if (k == "max_instructions_per_call") sandbox.max_instructions_per_call = parse_u32(v, static_cast<std::uint32_t>(sandbox.max_instructions_per_call));
        else if (k == "max_execution_time_sec") sandbox.max_execution_time_sec = parse_float(v, static_cast<float>(sandbox.max_execution_time_sec));
        return;
    }

    if (sec == "memory") {
        auto& memory = config_.memory;
        if (k == "guest_heap_bytes") memory.guest_heap_bytes = parse_u32(v, memory.guest_heap_bytes);
        else if (k == "guest_heap_limit_bytes") memory.guest_heap_limit_bytes = parse_u32(v, memory.guest_heap_limit_bytes);
        else if (k == "max_string_bytes") memory.max_string_bytes = parse_u32(v, memory.max_string_bytes);
        else if (k == "max_array_items") memory.max_array_items = parse_u32(v, memory.max_array_items);
        return;
    }

    if (sec == "host") {
        auto& host = config_.host;
        if (k == "tick_rate") host.tick_rate = parse_float(v, host.tick_rate);
        else if (k == "ticks") host.ticks = parse_int(v, host.ticks);
        return;
    }
}

void ConfigLoader::load_from_stream(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;): cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }

    // Keep the heap limit coherent with the initial size.
    if (config_.memory.guest_heap_limit_bytes < config_.memory.guest_heap_bytes) {
        config_.memory.guest_heap_limit_bytes = config_.memory.guest_heap_bytes;
    }
}

bool ConfigLoader::load_from_file(const std::string& path, std::string* outError) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (outError) *outError = "cannot open " + path;
        return false;
    }

    load_from_stream(in);
    loaded_from_path_ = path;
    return true;
}

} // namespace scriptscene::core
