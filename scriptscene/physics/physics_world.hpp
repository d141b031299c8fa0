#pragma once

#include "../core/types.hpp"
#include "../resource/resource_types.hpp"

#include <raylib.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace scriptscene::physics {

using BodyHandle = std::uint32_t;

struct RigidBodyDesc {
    resource::PhysicsBodyType type{resource::PhysicsBodyType::Static};
    Vector3 linearVelocity{0.0f, 0.0f, 0.0f};
    Vector3 angularVelocity{0.0f, 0.0f, 0.0f};
};

struct ColliderDesc {
    resource::ColliderType type{resource::ColliderType::Box};
    bool isTrigger{false};
    Vector3 halfExtents{0.5f, 0.5f, 0.5f};
    float radius{0.5f};
    float height{1.0f};
    ResourceId mesh{kNullResource};
    bool collisionEvents{false};
};

struct ContactEvent {
    ResourceId a{kNullResource};
    ResourceId b{kNullResource};
    bool started{true};
};

// Physics and interaction collaborator. The host only creates, queries and
// removes bodies here; simulation belongs to the implementation.
class IPhysicsWorld {
public:
    virtual ~IPhysicsWorld() = default;

    // One body per node. Returns the handle colliders attach to.
    virtual BodyHandle create_rigid_body(ResourceId node, const RigidBodyDesc& desc) = 0;
    virtual void create_collider(BodyHandle body, const ColliderDesc& desc) = 0;

    // Removes the node's body and every collider attached to it.
    virtual bool remove_rigid_body(ResourceId node) = 0;
    virtual bool has_rigid_body(ResourceId node) const = 0;
    virtual std::optional<RigidBodyDesc> rigid_body(ResourceId node) const = 0;
    virtual std::size_t collider_count(ResourceId node) const = 0;

    // Interaction markers (raycast targets) for nodes and UI buttons.
    virtual void add_interactable(ResourceId owner, resource::InteractableType type) = 0;
    virtual bool remove_interactable(ResourceId owner) = 0;
    virtual bool has_interactable(ResourceId owner) const = 0;

    virtual void push_contact(const ContactEvent& event) = 0;
    virtual std::vector<ContactEvent> drain_contact_events() = 0;

    virtual std::size_t body_count() const = 0;
};

} // namespace scriptscene::physics
