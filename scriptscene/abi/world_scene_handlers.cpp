#include "handler_support.hpp"

#include "../marshal/decoders.hpp"

#include <vector>

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;

namespace {

// Shared by scene_get_nodes and node_get_children.
template <typename ParentT>
double write_children(CallContext& ctx, ResourceId parent, std::uint32_t arrPtr, std::uint32_t maxCount) {
    if (maxCount > ctx.limits().max_array_items) {
        throw AbiError(AbiErrorKind::DecodeError, "child array of " + std::to_string(maxCount) + " exceeds limit");
    }

    std::vector<ResourceId> ids(maxCount);
    const std::uint32_t written = ctx.bridge().children<ParentT>(parent, ids);

    if (written > 0) {
        ctx.cursor.move_to_block(arrPtr);
        ctx.cursor.write_u32_array(std::span<const std::uint32_t>(ids.data(), written));
    }
    return written;
}

} // namespace

void register_world_scene(Dispatcher& d) {
    d.add("world_get_environment", ReturnKind::Id, [](CallContext& ctx, const AbiArgs&) {
        return as_id(ctx.visible(ctx.host.environment_scene()));
    });

    d.add("world_set_environment", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        if (ctx.host.environment_scene() == kNullResource) {
            throw AbiError(AbiErrorKind::InvalidState, "environment not set");
        }
        const ResourceId scene = a.u32(0);
        ctx.require<res::Scene>(scene);
        ctx.host.set_environment_scene(scene);
        return kOk;
    });

    d.add("world_create_scene", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        marshal::SceneProps props = marshal::decode_scene(decoder, a.u32(0));
        return as_id(ctx.create(std::move(props.name), res::Scene{}).id);
    });

    d.add("world_find_scene_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Scene>(ctx, a.u32(0), a.u32(1)));
    });

    // Only the creating environment may dispose; shared grants are not enough.
    d.add("world_dispose_resource", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId id = a.u32(0);
        if (!ctx.caps().permits(ctx.registry(), id)) {
            throw AbiError(AbiErrorKind::NotAuthorized, "resource " + std::to_string(id) + " not granted");
        }
        const res::Resource* r = ctx.registry().find(id);
        if (!r) {
            throw AbiError(AbiErrorKind::NotFound, "resource " + std::to_string(id) + " not registered");
        }
        if (r->owner != ctx.env.id) {
            throw AbiError(AbiErrorKind::NotAuthorized,
                           "resource " + std::to_string(id) + " is owned by another environment");
        }
        ctx.host.dispose(id);
        return kOk;
    });

    d.add("scene_add_node", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.bridge().add_scene_node(a.u32(0), a.u32(1));
        return kOk;
    });

    d.add("scene_remove_node", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.bridge().remove_scene_node(a.u32(0), a.u32(1));
        return kOk;
    });

    d.add("scene_get_node_count", ReturnKind::Count, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.bridge().child_count<res::Scene>(a.u32(0)));
    });

    d.add("scene_get_nodes", ReturnKind::Count, [](CallContext& ctx, const AbiArgs& a) {
        return write_children<res::Scene>(ctx, a.u32(0), a.u32(1), a.u32(2));
    });

    d.add("scene_get_node", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.bridge().child_at<res::Scene>(a.u32(0), a.u32(1)));
    });

    d.add("node_get_children", ReturnKind::Count, [](CallContext& ctx, const AbiArgs& a) {
        return write_children<res::Node>(ctx, a.u32(0), a.u32(1), a.u32(2));
    });
}

} // namespace scriptscene::abi
