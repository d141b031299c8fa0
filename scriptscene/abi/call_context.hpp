#pragma once

#include "../host/host_context.hpp"
#include "../marshal/decode_context.hpp"
#include "../scene/scene_bridge.hpp"

#include <string>

namespace scriptscene::abi {

// Per-call view of the host as one environment sees it. Built fresh for every
// ABI call; the cursor spans the caller's guest heap.
struct CallContext {
    CallContext(host::HostContext& host_, host::Environment& env_)
        : host(host_), env(env_), cursor(env_.memory.cursor(host_.config().memory.max_string_bytes)) {}

    host::HostContext& host;
    host::Environment& env;
    CursorView cursor;

    resource::ResourceRegistry& registry() { return host.registry(); }
    const resource::CapabilitySet& caps() const { return env.caps; }
    const core::MemorySettings& limits() const { return host.config().memory; }

    marshal::DecodeContext decoder() {
        return marshal::DecodeContext{cursor, host.registry(), env.caps, host.config().memory};
    }

    scene::SceneBridge bridge() {
        return scene::SceneBridge(host.registry(), host.graph(), env.caps);
    }

    // Throws AbiError unless `id` is a granted, live T.
    template <typename T>
    T& require(ResourceId id) {
        return env.caps.require<T>(host.registry(), id);
    }

    // `id` if the caller may reference it, else 0.
    ResourceId visible(ResourceId id) const {
        return env.caps.permits(host.registry(), id) ? id : kNullResource;
    }

    // Registers a resource owned by and granted to the caller.
    resource::Resource& create(std::string name, resource::ResourceData data) {
        return host.create_resource(&env, std::move(name), std::move(data));
    }

    // (ptr, len) string argument; ptr 0 is the empty string.
    std::string string_arg(std::uint32_t ptr, std::uint32_t byteLength) {
        if (ptr == 0) return {};
        return cursor.string_at(ptr, byteLength);
    }
};

} // namespace scriptscene::abi
