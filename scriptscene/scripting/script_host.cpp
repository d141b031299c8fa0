#include "script_host.hpp"

#include "../core/logger.hpp"
#include "../host/host_context.hpp"

#include <fstream>
#include <sstream>

namespace scriptscene::scripting {

namespace {

std::string file_stem(const std::string& path) {
    const auto slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    const auto dot = base.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        base.erase(dot);
    }
    return base;
}

} // namespace

ScriptHost::ScriptHost(host::HostContext& host) : host_(host) {
    abi::register_all(dispatcher_);
}

ScriptHost::~ScriptHost() {
    unload_all();
}

ScriptResult ScriptHost::load_script(const std::string& name, const std::string& source, EnvironmentId* outId) {
    auto script = std::make_unique<ScriptEnvironment>(host_, dispatcher_);
    if (!script->init(name)) {
        return ScriptResult::fail(script->last_error());
    }

    auto result = script->load(source, name);
    if (!result) {
        core::logf(LogLevel::Error, "script", "[%s] %s", name.c_str(), result.error.c_str());
        script->unload();
        return result;
    }

    const EnvironmentId id = script->id();
    scripts_[id] = std::move(script);
    if (outId) {
        *outId = id;
    }
    return ScriptResult::ok();
}

ScriptResult ScriptHost::load_file(const std::string& path, EnvironmentId* outId) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ScriptResult::fail("Failed to open script file: " + path);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    return load_script(file_stem(path), ss.str(), outId);
}

void ScriptHost::update(float deltaTime) {
    for (auto& [id, script] : scripts_) {
        script->update(deltaTime);
    }
    host_.end_tick();
}

bool ScriptHost::unload(EnvironmentId id) {
    auto it = scripts_.find(id);
    if (it == scripts_.end()) {
        return false;
    }
    it->second->unload();
    scripts_.erase(it);
    return true;
}

void ScriptHost::unload_all() {
    for (auto& [id, script] : scripts_) {
        script->unload();
    }
    scripts_.clear();
}

ScriptEnvironment* ScriptHost::script(EnvironmentId id) {
    auto it = scripts_.find(id);
    return it == scripts_.end() ? nullptr : it->second.get();
}

} // namespace scriptscene::scripting
