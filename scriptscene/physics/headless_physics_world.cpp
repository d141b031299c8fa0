#include "headless_physics_world.hpp"

#include "../core/abi_error.hpp"
#include "../core/logger.hpp"

namespace scriptscene::physics {

BodyHandle HeadlessPhysicsWorld::create_rigid_body(ResourceId node, const RigidBodyDesc& desc) {
    if (bodies_.count(node) != 0) {
        throw AbiError(AbiErrorKind::InvalidState,
                       "node " + std::to_string(node) + " already has a rigid body");
    }

    const auto entity = world_.create();
    world_.emplace<RigidBodyComponent>(entity, node, desc);
    bodies_[node] = entity;

    core::logf(LogLevel::Debug, "physics", "rigid body for node %u (type %u)",
               node, static_cast<unsigned>(desc.type));

    return static_cast<BodyHandle>(entt::to_integral(entity));
}

void HeadlessPhysicsWorld::create_collider(BodyHandle body, const ColliderDesc& desc) {
    const auto bodyEntity = static_cast<entt::entity>(body);
    if (!world_.valid(bodyEntity) || !world_.all_of<RigidBodyComponent>(bodyEntity)) {
        throw AbiError(AbiErrorKind::InvalidState, "collider attached to unknown body");
    }

    const auto entity = world_.create();
    world_.emplace<ColliderComponent>(entity, bodyEntity, desc);
}

bool HeadlessPhysicsWorld::remove_rigid_body(ResourceId node) {
    auto it = bodies_.find(node);
    if (it == bodies_.end()) {
        return false;
    }

    const entt::entity body = it->second;

    std::vector<entt::entity> colliders;
    auto view = world_.view<ColliderComponent>();
    for (auto entity : view) {
        if (view.get<ColliderComponent>(entity).body == body) {
            colliders.push_back(entity);
        }
    }
    for (auto entity : colliders) {
        world_.destroy(entity);
    }

    world_.destroy(body);
    bodies_.erase(it);
    return true;
}

bool HeadlessPhysicsWorld::has_rigid_body(ResourceId node) const {
    return bodies_.count(node) != 0;
}

std::optional<RigidBodyDesc> HeadlessPhysicsWorld::rigid_body(ResourceId node) const {
    auto it = bodies_.find(node);
    if (it == bodies_.end()) {
        return std::nullopt;
    }
    return world_.get<RigidBodyComponent>(it->second).desc;
}

std::size_t HeadlessPhysicsWorld::collider_count(ResourceId node) const {
    auto it = bodies_.find(node);
    if (it == bodies_.end()) {
        return 0;
    }

    std::size_t n = 0;
    auto view = world_.view<const ColliderComponent>();
    for (auto entity : view) {
        if (view.get<const ColliderComponent>(entity).body == it->second) {
            ++n;
        }
    }
    return n;
}

void HeadlessPhysicsWorld::add_interactable(ResourceId owner, resource::InteractableType type) {
    if (interactables_.count(owner) != 0) {
        throw AbiError(AbiErrorKind::InvalidState,
                       "resource " + std::to_string(owner) + " is already interactable");
    }

    const auto entity = world_.create();
    world_.emplace<InteractableComponent>(entity, owner, type);
    interactables_[owner] = entity;
}

bool HeadlessPhysicsWorld::remove_interactable(ResourceId owner) {
    auto it = interactables_.find(owner);
    if (it == interactables_.end()) {
        return false;
    }

    world_.destroy(it->second);
    interactables_.erase(it);
    return true;
}

bool HeadlessPhysicsWorld::has_interactable(ResourceId owner) const {
    return interactables_.count(owner) != 0;
}

void HeadlessPhysicsWorld::push_contact(const ContactEvent& event) {
    contacts_.push_back(event);
}

std::vector<ContactEvent> HeadlessPhysicsWorld::drain_contact_events() {
    std::vector<ContactEvent> out;
    out.swap(contacts_);
    return out;
}

} // namespace scriptscene::physics
