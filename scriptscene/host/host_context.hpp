#pragma once

#include "../core/config.hpp"
#include "../core/guest_memory.hpp"
#include "../physics/physics_world.hpp"
#include "../resource/capability_set.hpp"
#include "../scene/transform_graph.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace scriptscene::host {

// One loaded script: its grants and its private heap.
struct Environment {
    Environment(EnvironmentId id_, std::string name_, const core::MemorySettings& memory_)
        : id(id_), name(std::move(name_)),
          memory(memory_.guest_heap_bytes, memory_.guest_heap_limit_bytes) {}

    EnvironmentId id;
    std::string name;
    resource::CapabilitySet caps;
    GuestMemory memory;
};

// Camera rig orbit requested by a script.
struct OrbitState {
    bool active{false};
    ResourceId node{kNullResource};
    EnvironmentId requestedBy{kHostOwner};
    float pitch{0.0f};
    float yaw{0.0f};
    float zoom{1.0f};
};

// =============================================================================
// HostContext - explicit state passed to every ABI operation
// =============================================================================

class HostContext {
public:
    explicit HostContext(const core::HostConfig& config,
                         std::unique_ptr<physics::IPhysicsWorld> physics = nullptr);
    ~HostContext();

    HostContext(const HostContext&) = delete;
    HostContext& operator=(const HostContext&) = delete;

    // --- Environments ---

    Environment& create_environment(std::string name);
    Environment* environment(EnvironmentId id);
    std::vector<EnvironmentId> environment_ids() const;

    // Releases everything the environment owns, then forgets it.
    void unload_environment(EnvironmentId id);

    // --- Resources ---

    // Registers a resource owned by `owner` (nullptr = host) and grants it to
    // that environment.
    resource::Resource& create_resource(Environment* owner, std::string name, resource::ResourceData data);

    // Host-mediated sharing; ownership stays with the creator.
    bool grant(EnvironmentId env, ResourceId id);
    bool revoke(EnvironmentId env, ResourceId id);

    // Detaches and unregisters every resource owned by `env` and clears its
    // grants. Resources of the host or of other environments are untouched.
    // Returns the number released; a repeated call releases nothing.
    std::size_t revoke_all(EnvironmentId env);

    // Releases one resource together with the parts created with it (mesh
    // primitives, accessors the host generated for a primitive, accessor
    // buffers, button interactables). Parts owned by someone else are left
    // alone.
    void dispose(ResourceId id);

    // --- Interaction ---

    // `target` is a node, a UI button or an interactable. Returns false when
    // nothing interactable is attached.
    bool set_interaction_state(ResourceId target, bool pressed, bool held, bool released);

    // Clears pressed/released edges and drains contacts. Called once per tick.
    void end_tick();

    // --- World state ---

    ResourceId environment_scene() const { return environmentScene_; }
    void set_environment_scene(ResourceId scene) { environmentScene_ = scene; }

    OrbitState& orbit() { return orbit_; }

    resource::ResourceRegistry& registry() { return registry_; }
    scene::TransformGraph& graph() { return graph_; }
    physics::IPhysicsWorld& physics() { return *physics_; }
    const core::HostConfig& config() const { return config_; }

    Tick tick() const { return tick_; }

private:
    void collect_parts(ResourceId id, EnvironmentId owner, std::unordered_set<ResourceId>& out);
    void release(const std::unordered_set<ResourceId>& ids);
    void detach_resource(resource::Resource& r);
    void scrub_references(resource::Resource& r, const std::unordered_set<ResourceId>& released);

    core::HostConfig config_;
    resource::ResourceRegistry registry_;
    scene::TransformGraph graph_;
    std::unique_ptr<physics::IPhysicsWorld> physics_;

    std::map<EnvironmentId, std::unique_ptr<Environment>> environments_;
    EnvironmentId nextEnvironmentId_{1};

    ResourceId environmentScene_{kNullResource};
    OrbitState orbit_{};
    Tick tick_{0};
};

} // namespace scriptscene::host
