#include "dispatcher.hpp"

#include "../core/logger.hpp"

#include <exception>

namespace scriptscene::abi {

void Dispatcher::add(std::string name, ReturnKind kind, Handler handler) {
    add(std::move(name), kind, default_sentinel(kind), std::move(handler));
}

void Dispatcher::add(std::string name, ReturnKind kind, double sentinel, Handler handler) {
    Entry entry;
    entry.handler = std::move(handler);
    entry.kind = kind;
    entry.sentinel = sentinel;
    entries_[std::move(name)] = std::move(entry);
}

bool Dispatcher::contains(std::string_view name) const {
    return entries_.find(name) != entries_.end();
}

const Entry* Dispatcher::entry(std::string_view name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> Dispatcher::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

double Dispatcher::call(std::string_view name, CallContext& ctx, const AbiArgs& args) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        core::logf(LogLevel::Error, "abi", "[%.*s] unknown function",
                   static_cast<int>(name.size()), name.data());
        return -1.0;
    }

    const Entry& entry = it->second;

    try {
        return entry.handler(ctx, args);
    } catch (const AbiError& e) {
        core::logf(LogLevel::Warning, "abi", "[%s] %s: %s (env %u '%s')",
                   it->first.c_str(), abi_error_name(e.kind()), e.what(),
                   ctx.env.id, ctx.env.name.c_str());
    } catch (const std::exception& e) {
        core::logf(LogLevel::Error, "abi", "[%s] host error: %s (env %u '%s')",
                   it->first.c_str(), e.what(), ctx.env.id, ctx.env.name.c_str());
    }
    return entry.sentinel;
}

void register_all(Dispatcher& dispatcher) {
    register_world_scene(dispatcher);
    register_node(dispatcher);
    register_mesh_accessor(dispatcher);
    register_material_texture_light(dispatcher);
    register_interaction_physics(dispatcher);
    register_ui(dispatcher);
}

} // namespace scriptscene::abi
