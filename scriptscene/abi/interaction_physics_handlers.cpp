#include "handler_support.hpp"

#include "../host/rollback_scope.hpp"
#include "../marshal/decoders.hpp"

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;

namespace {

physics::ColliderDesc collider_desc(const res::Collider& collider) {
    physics::ColliderDesc desc;
    desc.type = collider.type;
    desc.isTrigger = collider.isTrigger;
    desc.halfExtents = Vector3{collider.size[0] / 2.0f, collider.size[1] / 2.0f, collider.size[2] / 2.0f};
    desc.radius = collider.radius;
    desc.height = collider.height;
    desc.mesh = collider.mesh;
    return desc;
}

// Interaction state attached to a granted node.
res::Interactable& interactable_of(CallContext& ctx, ResourceId nodeId) {
    const res::Node& node = ctx.require<res::Node>(nodeId);
    auto* interactable = ctx.registry().find_as<res::Interactable>(node.interactable);
    if (!interactable) {
        throw AbiError(AbiErrorKind::InvalidState, "node " + std::to_string(nodeId) + " is not interactable");
    }
    return *interactable;
}

} // namespace

void register_interaction_physics(Dispatcher& d) {
    // --- Interactables ---

    // Scripts may only add the plain Interactable kind; the others are host-assigned.
    d.add("add_interactable", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        res::Node& node = ctx.require<res::Node>(nodeId);

        const std::uint32_t raw = a.u32(1);
        const res::InteractableType type =
            marshal::require_enum(res::interactable_type_from(raw), raw, "interactable type");

        if (node.interactable != kNullResource) {
            throw AbiError(AbiErrorKind::InvalidState, "node is already interactable");
        }
        if (type != res::InteractableType::Interactable) {
            throw AbiError(AbiErrorKind::InvalidState, "scripts may only add plain interactables");
        }

        host::RollbackScope rollback;

        res::Interactable interactable;
        interactable.type = type;
        interactable.target = nodeId;
        const ResourceId interactableId = ctx.create("", interactable).id;
        rollback.on_rollback([&ctx, interactableId] { ctx.host.dispose(interactableId); });

        ctx.host.physics().add_interactable(nodeId, type);

        node.interactable = interactableId;
        rollback.commit();
        return kOk;
    });

    d.add("remove_interactable", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        const res::Node& node = ctx.require<res::Node>(nodeId);
        if (node.interactable == kNullResource) {
            throw AbiError(AbiErrorKind::InvalidState, "node is not interactable");
        }

        const ResourceId interactableId = node.interactable;
        ctx.host.physics().remove_interactable(nodeId);
        // Releasing the interactable also clears node.interactable.
        ctx.host.dispose(interactableId);
        return kOk;
    });

    d.add("has_interactable", ReturnKind::Flag, [](CallContext& ctx, const AbiArgs& a) {
        const res::Node& node = ctx.require<res::Node>(a.u32(0));
        return as_flag(ctx.registry().find_as<res::Interactable>(node.interactable) != nullptr);
    });

    d.add("get_interactable", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const res::Interactable& interactable = interactable_of(ctx, a.u32(0));
        marshal::write_interactable_state(ctx.cursor, a.u32(1), interactable);
        return kOk;
    });

    d.add("get_interactable_pressed", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(interactable_of(ctx, a.u32(0)).pressed);
    });

    d.add("get_interactable_held", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(interactable_of(ctx, a.u32(0)).held);
    });

    d.add("get_interactable_released", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(interactable_of(ctx, a.u32(0)).released);
    });

    // --- Colliders ---

    d.add("collider_find_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Collider>(ctx, a.u32(0), a.u32(1)));
    });

    d.add("create_collider", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        const res::Collider collider = marshal::decode_collider(decoder, a.u32(0));
        return as_id(ctx.create("", collider).id);
    });

    // --- Rigid bodies ---

    // The body picks up the node's own collider plus the colliders of direct
    // children the caller can see that have no body of their own.
    d.add("add_physics_body", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        const res::Node& node = ctx.require<res::Node>(nodeId);
        physics::IPhysicsWorld& world = ctx.host.physics();

        if (world.has_rigid_body(nodeId)) {
            throw AbiError(AbiErrorKind::InvalidState, "node already has a rigid body");
        }

        auto decoder = ctx.decoder();
        const physics::RigidBodyDesc desc = marshal::decode_physics_body(decoder, a.u32(1));

        host::RollbackScope rollback;

        const physics::BodyHandle body = world.create_rigid_body(nodeId, desc);
        rollback.on_rollback([&world, nodeId] { world.remove_rigid_body(nodeId); });

        if (const auto* collider = ctx.registry().find_as<res::Collider>(node.collider)) {
            world.create_collider(body, collider_desc(*collider));
        }

        for (ResourceId child = node.firstChild; child != kNullResource;) {
            const auto* childNode = ctx.registry().find_as<res::Node>(child);
            if (!childNode) break;

            if (ctx.caps().permits(ctx.registry(), child) && !world.has_rigid_body(child)) {
                if (const auto* collider = ctx.registry().find_as<res::Collider>(childNode->collider)) {
                    world.create_collider(body, collider_desc(*collider));
                }
            }
            child = childNode->nextSibling;
        }

        rollback.commit();
        return kOk;
    });

    d.add("remove_physics_body", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        ctx.require<res::Node>(nodeId);
        ctx.host.physics().remove_rigid_body(nodeId);
        return kOk;
    });

    d.add("has_physics_body", ReturnKind::Flag, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId nodeId = a.u32(0);
        ctx.require<res::Node>(nodeId);
        return as_flag(ctx.host.physics().has_rigid_body(nodeId));
    });
}

} // namespace scriptscene::abi
