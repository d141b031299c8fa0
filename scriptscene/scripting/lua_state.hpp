#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sol {
class state;
}

namespace scriptscene::scripting {

// Script execution result
struct ScriptResult {
    bool success{false};
    std::string error;

    static ScriptResult ok() { return {true, ""}; }
    static ScriptResult fail(const std::string& err) { return {false, err}; }

    explicit operator bool() const { return success; }
};

// Per-environment budget. Instructions and time are counted per host->guest call.
struct ScriptLimits {
    std::size_t maxMemoryBytes{32 * 1024 * 1024};
    std::size_t maxInstructions{5000000};
    double maxExecutionTimeSec{2.0};
};

// Globals stripped from every sandboxed state.
const std::vector<std::string>& stripped_globals();

// One guest VM: tracking allocator, safe libraries, call budget.
class LuaState {
public:
    LuaState();
    ~LuaState();

    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&&) noexcept;
    LuaState& operator=(LuaState&&) noexcept;

    // Opens base, coroutine, string, table, math and utf8 under a heap cap
    // of `memoryLimitBytes` (0 = uncapped).
    bool init(std::size_t memoryLimitBytes = 0);

    void apply_sandbox(const ScriptLimits& limits = {});
    bool is_sandboxed() const { return sandboxed_; }

    // Runs a chunk
    ScriptResult execute(const std::string& script, const std::string& chunkName = "script");

    // Compiles without running
    ScriptResult load(const std::string& script, const std::string& chunkName = "script");

    // Calls a global function; each call gets a fresh budget
    ScriptResult call(const std::string& funcName);
    ScriptResult call(const std::string& funcName, float arg1);

    bool has_function(const std::string& funcName) const;

    sol::state& state();
    const sol::state& state() const;

    std::size_t memory_used() const;
    std::size_t peak_memory() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool sandboxed_{false};
};

// init() + apply_sandbox(); nullptr if the VM could not be created.
std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits = {});

} // namespace scriptscene::scripting
