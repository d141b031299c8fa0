#pragma once

#include "script_environment.hpp"

#include "../abi/dispatcher.hpp"

#include <map>
#include <memory>
#include <string>

namespace scriptscene::host {
class HostContext;
}

namespace scriptscene::scripting {

// Loads guest scripts into their own environments and ticks them.
class ScriptHost {
public:
    explicit ScriptHost(host::HostContext& host);
    ~ScriptHost();

    ScriptHost(const ScriptHost&) = delete;
    ScriptHost& operator=(const ScriptHost&) = delete;

    // A script that fails to load is unloaded again; nothing it created survives.
    ScriptResult load_script(const std::string& name, const std::string& source, EnvironmentId* outId = nullptr);
    ScriptResult load_file(const std::string& path, EnvironmentId* outId = nullptr);

    // on_update(dt) for every script, then the host's end of tick.
    void update(float deltaTime);

    bool unload(EnvironmentId id);
    void unload_all();

    ScriptEnvironment* script(EnvironmentId id);
    std::size_t script_count() const { return scripts_.size(); }

    const abi::Dispatcher& dispatcher() const { return dispatcher_; }
    host::HostContext& host() { return host_; }

private:
    host::HostContext& host_;
    abi::Dispatcher dispatcher_;
    std::map<EnvironmentId, std::unique_ptr<ScriptEnvironment>> scripts_;
};

} // namespace scriptscene::scripting
