#pragma once

#include <cstdint>
#include <string>

namespace scriptscene {

// ============================================================================
// Core Types
// ============================================================================

using ResourceId = std::uint32_t;
using EnvironmentId = std::uint32_t;
using RegistrationSerial = std::uint64_t;
using Tick = std::uint64_t;

static constexpr ResourceId kNullResource = 0;

// Owner id used for resources created by the host itself (environment setup).
static constexpr EnvironmentId kHostOwner = 0;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace scriptscene
