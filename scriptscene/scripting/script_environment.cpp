#include "script_environment.hpp"

#include "sandbox.hpp"

#include "../abi/dispatcher.hpp"
#include "../abi/lua_binding.hpp"
#include "../core/logger.hpp"
#include "../host/host_context.hpp"

namespace scriptscene::scripting {

ScriptEnvironment::ScriptEnvironment(host::HostContext& host, const abi::Dispatcher& dispatcher)
    : host_(host), dispatcher_(dispatcher) {}

ScriptEnvironment::~ScriptEnvironment() {
    unload();
}

bool ScriptEnvironment::init(const std::string& name) {
    name_ = name;
    envId_ = host_.create_environment(name).id;

    // Every script may see the shared environment scene.
    if (host_.environment_scene() != kNullResource) {
        host_.grant(envId_, host_.environment_scene());
    }

    SandboxConfig cfg = SandboxConfig::from_settings(host_.config().sandbox);
    cfg.printHandler = [envName = name](const std::string& msg) {
        core::logf(LogLevel::Info, "script", "[%s] %s", envName.c_str(), msg.c_str());
    };

    lua_ = Sandbox::create(cfg);
    if (!lua_) {
        lastError_ = "Failed to create sandboxed Lua state";
        host_.unload_environment(envId_);
        released_ = true;
        return false;
    }

    abi::bind_abi_table(lua_->state(), dispatcher_, host_, envId_);
    abi::bind_memory_table(lua_->state(), host_, envId_);

    core::logf(LogLevel::Debug, "script", "[%s] bound %zu abi functions", name_.c_str(), dispatcher_.size());
    return true;
}

ScriptResult ScriptEnvironment::load(const std::string& source, const std::string& chunkName) {
    if (!lua_ || released_) {
        return ScriptResult::fail("Environment not initialized");
    }

    auto validation = Sandbox::validate_script(source);
    for (const auto& warning : validation.warnings) {
        core::logf(LogLevel::Warning, "script", "[%s] %s", name_.c_str(), warning.c_str());
    }
    if (!validation.valid) {
        std::string errors;
        for (const auto& err : validation.errors) {
            if (!errors.empty()) errors += "; ";
            errors += err;
        }
        lastError_ = "Script validation failed: " + errors;
        return ScriptResult::fail(lastError_);
    }

    auto result = lua_->execute(source, chunkName);
    if (!result) {
        lastError_ = "Failed to load '" + chunkName + "': " + result.error;
        return ScriptResult::fail(lastError_);
    }

    loaded_ = true;
    call_hook("on_init");
    return ScriptResult::ok();
}

void ScriptEnvironment::update(float deltaTime) {
    if (!loaded_) return;
    call_hook("on_update", deltaTime);
}

void ScriptEnvironment::unload() {
    if (released_) return;

    if (loaded_) {
        call_hook("on_unload");
    }
    loaded_ = false;

    if (lua_) {
        core::logf(LogLevel::Debug, "script", "[%s] unloading (peak Lua heap %zu bytes)",
                   name_.c_str(), lua_->peak_memory());
    }
    host_.unload_environment(envId_);
    released_ = true;
}

void ScriptEnvironment::call_hook(const char* hookName) {
    if (!lua_->has_function(hookName)) return;

    auto result = lua_->call(hookName);
    if (!result) {
        lastError_ = std::string("Hook '") + hookName + "' error: " + result.error;
        core::logf(LogLevel::Error, "script", "[%s] %s", name_.c_str(), lastError_.c_str());
    }
}

void ScriptEnvironment::call_hook(const char* hookName, float arg) {
    if (!lua_->has_function(hookName)) return;

    auto result = lua_->call(hookName, arg);
    if (!result) {
        lastError_ = std::string("Hook '") + hookName + "' error: " + result.error;
        core::logf(LogLevel::Error, "script", "[%s] %s", name_.c_str(), lastError_.c_str());
    }
}

} // namespace scriptscene::scripting
