#pragma once

#include "lua_state.hpp"

#include "../core/config.hpp"

#include <functional>
#include <string>
#include <vector>

namespace scriptscene::scripting {

// Sandbox configuration for guest scripts
struct SandboxConfig {
    // Memory limits
    std::size_t maxMemoryMB{32};

    // Execution limits
    std::size_t maxInstructionsPerCall{5000000};  // 5M
    double maxExecutionTimeSec{2.0};

    // Custom print handler
    std::function<void(const std::string&)> printHandler;

    static SandboxConfig from_settings(const core::SandboxSettings& settings) {
        SandboxConfig cfg;
        cfg.maxMemoryMB = settings.max_memory_mb;
        cfg.maxInstructionsPerCall = settings.max_instructions_per_call;
        cfg.maxExecutionTimeSec = settings.max_execution_time_sec;
        return cfg;
    }

    ScriptLimits to_script_limits() const {
        ScriptLimits limits;
        limits.maxMemoryBytes = maxMemoryMB * 1024 * 1024;
        limits.maxInstructions = maxInstructionsPerCall;
        limits.maxExecutionTimeSec = maxExecutionTimeSec;
        return limits;
    }
};

// Validation result for scripts
struct ValidationResult {
    bool valid{false};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    explicit operator bool() const { return valid; }
};

// Sandbox utility functions
class Sandbox {
public:
    // Syntax check plus forbidden-call scan, without executing anything
    static ValidationResult validate_script(const std::string& script);

    // Check if a script uses any forbidden functions
    static ValidationResult check_forbidden_calls(const std::string& script);

    // Create a sandboxed environment with the given config
    static std::unique_ptr<LuaState> create(const SandboxConfig& config);

    // Globals removed from every sandboxed state
    static const std::vector<std::string>& forbidden_functions();
};

} // namespace scriptscene::scripting
