#pragma once

#include "physics_world.hpp"

#include <entt/entt.hpp>

#include <unordered_map>

namespace scriptscene::physics {

// =============================================================================
// Components (POD, stored in the world's entt::registry)
// =============================================================================

struct RigidBodyComponent {
    ResourceId node{kNullResource};
    RigidBodyDesc desc{};
};

struct ColliderComponent {
    entt::entity body{entt::null};
    ColliderDesc desc{};
};

struct InteractableComponent {
    ResourceId owner{kNullResource};
    resource::InteractableType type{resource::InteractableType::Interactable};
};

// Bookkeeping-only physics world: bodies, colliders and interaction markers
// are entities, contacts are whatever the host pushes.
class HeadlessPhysicsWorld final : public IPhysicsWorld {
public:
    BodyHandle create_rigid_body(ResourceId node, const RigidBodyDesc& desc) override;
    void create_collider(BodyHandle body, const ColliderDesc& desc) override;

    bool remove_rigid_body(ResourceId node) override;
    bool has_rigid_body(ResourceId node) const override;
    std::optional<RigidBodyDesc> rigid_body(ResourceId node) const override;
    std::size_t collider_count(ResourceId node) const override;

    void add_interactable(ResourceId owner, resource::InteractableType type) override;
    bool remove_interactable(ResourceId owner) override;
    bool has_interactable(ResourceId owner) const override;

    void push_contact(const ContactEvent& event) override;
    std::vector<ContactEvent> drain_contact_events() override;

    std::size_t body_count() const override { return bodies_.size(); }

    entt::registry& registry() { return world_; }

private:
    entt::registry world_;
    std::unordered_map<ResourceId, entt::entity> bodies_;
    std::unordered_map<ResourceId, entt::entity> interactables_;
    std::vector<ContactEvent> contacts_;
};

} // namespace scriptscene::physics
