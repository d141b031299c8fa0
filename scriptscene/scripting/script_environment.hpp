#pragma once

#include "lua_state.hpp"

#include "../core/types.hpp"

#include <memory>
#include <string>

namespace scriptscene::host {
class HostContext;
}

namespace scriptscene::abi {
class Dispatcher;
}

namespace scriptscene::scripting {

// =============================================================================
// ScriptEnvironment - one guest script in its own sandbox
// =============================================================================
//
// Owns the Lua state and the host-side environment (grants + guest heap) the
// script runs against. Guest hooks, all optional:
//   on_init()        after the chunk ran
//   on_update(dt)    once per host tick
//   on_unload()      before the environment's resources are released

class ScriptEnvironment {
public:
    ScriptEnvironment(host::HostContext& host, const abi::Dispatcher& dispatcher);
    ~ScriptEnvironment();

    ScriptEnvironment(const ScriptEnvironment&) = delete;
    ScriptEnvironment& operator=(const ScriptEnvironment&) = delete;

    // Creates the environment and its sandboxed state with the `websg`,
    // `memory`, print and log globals installed.
    bool init(const std::string& name);

    // Validates and runs the chunk, then calls on_init.
    ScriptResult load(const std::string& source, const std::string& chunkName);

    void update(float deltaTime);

    // Calls on_unload, then releases everything the script owns. Idempotent.
    void unload();

    bool is_loaded() const { return loaded_; }
    EnvironmentId id() const { return envId_; }
    const std::string& name() const { return name_; }
    const std::string& last_error() const { return lastError_; }

    LuaState* lua_state() { return lua_.get(); }

private:
    void call_hook(const char* hookName);
    void call_hook(const char* hookName, float arg);

    host::HostContext& host_;
    const abi::Dispatcher& dispatcher_;

    std::unique_ptr<LuaState> lua_;
    EnvironmentId envId_{0};
    std::string name_;
    bool loaded_{false};
    bool released_{false};
    std::string lastError_;
};

} // namespace scriptscene::scripting
