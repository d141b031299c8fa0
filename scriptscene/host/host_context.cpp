#include "host_context.hpp"

#include "../core/logger.hpp"
#include "../physics/headless_physics_world.hpp"

#include <algorithm>
#include <type_traits>

namespace scriptscene::host {

namespace res = scriptscene::resource;

namespace {

void scrub(ResourceId& ref, const std::unordered_set<ResourceId>& released) {
    if (ref != kNullResource && released.count(ref)) {
        ref = kNullResource;
    }
}

void scrub(res::TextureRef& ref, const std::unordered_set<ResourceId>& released) {
    scrub(ref.texture, released);
}

void scrub_list(std::vector<ResourceId>& ids, const std::unordered_set<ResourceId>& released) {
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [&](ResourceId id) { return released.count(id) != 0; }),
              ids.end());
}

} // namespace

HostContext::HostContext(const core::HostConfig& config, std::unique_ptr<physics::IPhysicsWorld> physics)
    : config_(config),
      graph_(registry_),
      physics_(physics ? std::move(physics) : std::make_unique<physics::HeadlessPhysicsWorld>()) {}

HostContext::~HostContext() = default;

// =============================================================================
// Environments
// =============================================================================

Environment& HostContext::create_environment(std::string name) {
    const EnvironmentId id = nextEnvironmentId_++;
    auto env = std::make_unique<Environment>(id, std::move(name), config_.memory);
    Environment& ref = *env;
    environments_.emplace(id, std::move(env));

    core::logf(LogLevel::Info, "env", "environment %u '%s' created", id, ref.name.c_str());
    return ref;
}

Environment* HostContext::environment(EnvironmentId id) {
    auto it = environments_.find(id);
    return it == environments_.end() ? nullptr : it->second.get();
}

std::vector<EnvironmentId> HostContext::environment_ids() const {
    std::vector<EnvironmentId> ids;
    ids.reserve(environments_.size());
    for (const auto& [id, env] : environments_) {
        ids.push_back(id);
    }
    return ids;
}

void HostContext::unload_environment(EnvironmentId id) {
    auto it = environments_.find(id);
    if (it == environments_.end()) return;

    const std::size_t released = revoke_all(id);
    core::logf(LogLevel::Info, "env", "environment %u '%s' unloaded (%zu resources released)",
               id, it->second->name.c_str(), released);

    if (orbit_.active && orbit_.requestedBy == id) {
        orbit_ = OrbitState{};
    }
    environments_.erase(it);
}

// =============================================================================
// Resources
// =============================================================================

res::Resource& HostContext::create_resource(Environment* owner, std::string name, res::ResourceData data) {
    res::Resource& r = registry_.add(owner ? owner->id : kHostOwner, std::move(name), std::move(data));
    if (owner) {
        owner->caps.authorize(r);
    }
    return r;
}

bool HostContext::grant(EnvironmentId env, ResourceId id) {
    Environment* e = environment(env);
    const res::Resource* r = registry_.find(id);
    if (!e || !r) return false;

    e->caps.authorize(*r);
    return true;
}

bool HostContext::revoke(EnvironmentId env, ResourceId id) {
    Environment* e = environment(env);
    if (!e || !e->caps.contains(id)) return false;

    e->caps.revoke(id);
    return true;
}

std::size_t HostContext::revoke_all(EnvironmentId env) {
    Environment* e = environment(env);
    if (!e) return 0;

    std::unordered_set<ResourceId> owned;
    registry_.for_each([&](res::Resource& r) {
        if (r.owner == env) {
            owned.insert(r.id);
        }
    });

    release(owned);
    e->caps.clear();
    return owned.size();
}

void HostContext::dispose(ResourceId id) {
    const res::Resource* r = registry_.find(id);
    if (!r) return;

    std::unordered_set<ResourceId> ids;
    collect_parts(id, r->owner, ids);
    release(ids);
}

void HostContext::collect_parts(ResourceId id, EnvironmentId owner, std::unordered_set<ResourceId>& out) {
    res::Resource* r = registry_.find(id);
    if (!r || r->owner != owner || !out.insert(id).second) return;

    if (const auto* mesh = r->as<res::Mesh>()) {
        for (ResourceId p : mesh->primitives) collect_parts(p, owner, out);
    } else if (const auto* primitive = r->as<res::MeshPrimitive>()) {
        if (!primitive->ownsAccessors) return;
        for (ResourceId a : primitive->attributes) collect_parts(a, owner, out);
        collect_parts(primitive->indices, owner, out);
    } else if (const auto* accessor = r->as<res::Accessor>()) {
        collect_parts(accessor->bufferView, owner, out);
    } else if (const auto* view = r->as<res::BufferView>()) {
        collect_parts(view->buffer, owner, out);
    } else if (const auto* button = r->as<res::UIButton>()) {
        collect_parts(button->interactable, owner, out);
    } else if (const auto* node = r->as<res::Node>()) {
        collect_parts(node->interactable, owner, out);
    } else if (const auto* canvas = r->as<res::UICanvas>()) {
        const auto* mounted = registry_.find_as<res::Node>(canvas->mountedOn);
        if (mounted && mounted->uiCanvas == id) {
            collect_parts(mounted->interactable, owner, out);
        }
    }
}

// Two phases: unlink everything that is going away and clear references to it
// from the survivors, then unregister. No survivor is left holding a released
// id, which would otherwise resolve to whatever reuses the integer.
void HostContext::release(const std::unordered_set<ResourceId>& ids) {
    if (ids.empty()) return;

    for (ResourceId id : ids) {
        if (res::Resource* r = registry_.find(id)) {
            detach_resource(*r);
        }
    }

    registry_.for_each([&](res::Resource& r) {
        if (!ids.count(r.id)) {
            scrub_references(r, ids);
        }
    });

    if (ids.count(environmentScene_)) {
        environmentScene_ = kNullResource;
    }
    if (ids.count(orbit_.node)) {
        orbit_ = OrbitState{};
    }

    for (auto& [envId, env] : environments_) {
        for (ResourceId id : ids) {
            env->caps.revoke(id);
        }
    }

    for (ResourceId id : ids) {
        registry_.remove(id);
    }

    core::logf(LogLevel::Debug, "env", "released %zu resources", ids.size());
}

void HostContext::detach_resource(res::Resource& r) {
    if (r.as<res::Node>()) {
        graph_.detach(r.id);
        graph_.detach_children(r.id);
        physics_->remove_rigid_body(r.id);
        physics_->remove_interactable(r.id);
    } else if (r.as<res::Scene>()) {
        graph_.detach_children(r.id);
    } else if (auto* element = r.as<res::UIElement>()) {
        graph_.detach_ui_element(r.id);
        while (element->firstChild != kNullResource) {
            const ResourceId child = element->firstChild;
            graph_.detach_ui_element(child);
            if (element->firstChild == child) {
                // Child no longer resolves; drop the chain.
                element->firstChild = kNullResource;
            }
        }
    } else if (r.as<res::UIButton>()) {
        physics_->remove_interactable(r.id);
    } else if (const auto* interactable = r.as<res::Interactable>()) {
        // The marker is keyed to the target, which may outlive this resource.
        physics_->remove_interactable(interactable->target);
    } else if (const auto* canvas = r.as<res::UICanvas>()) {
        const auto* mounted = registry_.find_as<res::Node>(canvas->mountedOn);
        if (mounted && mounted->uiCanvas == r.id) {
            physics_->remove_rigid_body(canvas->mountedOn);
        }
    }
}

void HostContext::scrub_references(res::Resource& r, const std::unordered_set<ResourceId>& released) {
    std::visit([&](auto& p) {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, res::Node>) {
            scrub(p.camera, released);
            scrub(p.skin, released);
            scrub(p.mesh, released);
            scrub(p.light, released);
            scrub(p.collider, released);
            scrub(p.interactable, released);
            scrub(p.uiCanvas, released);
        } else if constexpr (std::is_same_v<T, res::Mesh>) {
            scrub_list(p.primitives, released);
        } else if constexpr (std::is_same_v<T, res::MeshPrimitive>) {
            for (ResourceId& a : p.attributes) scrub(a, released);
            scrub(p.indices, released);
            scrub(p.material, released);
        } else if constexpr (std::is_same_v<T, res::Accessor>) {
            scrub(p.bufferView, released);
        } else if constexpr (std::is_same_v<T, res::BufferView>) {
            scrub(p.buffer, released);
        } else if constexpr (std::is_same_v<T, res::Material>) {
            scrub(p.baseColorTexture, released);
            scrub(p.metallicRoughnessTexture, released);
            scrub(p.normalTexture, released);
            scrub(p.occlusionTexture, released);
            scrub(p.emissiveTexture, released);
        } else if constexpr (std::is_same_v<T, res::Skin>) {
            scrub_list(p.joints, released);
        } else if constexpr (std::is_same_v<T, res::Collider>) {
            scrub(p.mesh, released);
        } else if constexpr (std::is_same_v<T, res::Interactable>) {
            scrub(p.target, released);
        } else if constexpr (std::is_same_v<T, res::UICanvas>) {
            scrub(p.root, released);
            scrub(p.mountedOn, released);
        } else if constexpr (std::is_same_v<T, res::UIElement>) {
            scrub(p.text, released);
            scrub(p.button, released);
        } else if constexpr (std::is_same_v<T, res::UIButton>) {
            scrub(p.interactable, released);
        }
    }, r.data);
}

// =============================================================================
// Interaction
// =============================================================================

bool HostContext::set_interaction_state(ResourceId target, bool pressed, bool held, bool released) {
    res::Resource* r = registry_.find(target);
    if (!r) return false;

    ResourceId interactableId = kNullResource;
    if (const auto* node = r->as<res::Node>()) {
        interactableId = node->interactable;
    } else if (const auto* button = r->as<res::UIButton>()) {
        interactableId = button->interactable;
    } else if (r->as<res::Interactable>()) {
        interactableId = target;
    }

    auto* state = registry_.find_as<res::Interactable>(interactableId);
    if (!state) return false;

    state->pressed = pressed;
    state->held = held;
    state->released = released;
    return true;
}

void HostContext::end_tick() {
    registry_.for_each([](res::Resource& r) {
        if (auto* state = r.as<res::Interactable>()) {
            state->pressed = false;
            state->released = false;
        }
    });

    for (const physics::ContactEvent& event : physics_->drain_contact_events()) {
        core::logf(LogLevel::Debug, "physics", "contact %u <-> %u %s",
                   event.a, event.b, event.started ? "started" : "stopped");
    }

    ++tick_;
    core::Logger::instance().set_tick(tick_);
}

} // namespace scriptscene::host
