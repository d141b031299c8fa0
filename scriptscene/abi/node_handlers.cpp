#include "handler_support.hpp"

#include "../marshal/decoders.hpp"

#include <algorithm>

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;
using scene::TransformGraph;

namespace {

// Float-array views of a node's local transform. Each property can be read
// as a whole array or one element at a time, and written the same way.
struct TransformProperty {
    const char* name;
    std::size_t extent;
    std::array<float, 16> (*get)(const res::Node&);
    void (*set)(res::Node&, const std::array<float, 16>&);
};

std::array<float, 16> get_translation(const res::Node& n) {
    std::array<float, 16> out{};
    const auto v = scene::vector3_to_array(n.translation);
    std::copy(v.begin(), v.end(), out.begin());
    return out;
}

void set_translation(res::Node& n, const std::array<float, 16>& v) {
    TransformGraph::set_translation(n, scene::vector3_from_array({v[0], v[1], v[2]}));
}

std::array<float, 16> get_rotation(const res::Node& n) {
    std::array<float, 16> out{};
    const auto q = scene::quaternion_to_array(n.rotation);
    std::copy(q.begin(), q.end(), out.begin());
    return out;
}

void set_rotation(res::Node& n, const std::array<float, 16>& v) {
    TransformGraph::set_rotation(n, scene::quaternion_from_array({v[0], v[1], v[2], v[3]}));
}

std::array<float, 16> get_scale(const res::Node& n) {
    std::array<float, 16> out{};
    const auto s = scene::vector3_to_array(n.scale);
    std::copy(s.begin(), s.end(), out.begin());
    return out;
}

void set_scale(res::Node& n, const std::array<float, 16>& v) {
    TransformGraph::set_scale(n, scene::vector3_from_array({v[0], v[1], v[2]}));
}

std::array<float, 16> get_matrix(const res::Node& n) {
    return scene::matrix_to_array(n.localMatrix);
}

void set_matrix(res::Node& n, const std::array<float, 16>& v) {
    TransformGraph::set_local_matrix(n, scene::matrix_from_array(v));
}

constexpr TransformProperty kTransformProperties[] = {
    {"translation", 3, &get_translation, &set_translation},
    {"rotation", 4, &get_rotation, &set_rotation},
    {"scale", 3, &get_scale, &set_scale},
    {"matrix", 16, &get_matrix, &set_matrix},
};

void register_transform_property(Dispatcher& d, const TransformProperty& p) {
    const std::string prop = p.name;

    d.add("node_get_" + prop, ReturnKind::Status, [p](CallContext& ctx, const AbiArgs& a) {
        const res::Node& node = ctx.require<res::Node>(a.u32(0));
        const auto values = p.get(node);
        write_floats(ctx, a.u32(1), std::span<const float>(values.data(), p.extent));
        return kOk;
    });

    d.add("node_set_" + prop, ReturnKind::Status, [p](CallContext& ctx, const AbiArgs& a) {
        res::Node& node = ctx.require<res::Node>(a.u32(0));
        std::array<float, 16> values = p.get(node);
        ctx.cursor.move_to_block(a.u32(1));
        ctx.cursor.read_f32_array(std::span<float>(values.data(), p.extent));
        p.set(node, values);
        return kOk;
    });

    d.add("node_get_" + prop + "_element", ReturnKind::Scalar, [p](CallContext& ctx, const AbiArgs& a) {
        const res::Node& node = ctx.require<res::Node>(a.u32(0));
        const std::size_t index = element_index(a, 1, p.extent);
        return static_cast<double>(p.get(node)[index]);
    });

    d.add("node_set_" + prop + "_element", ReturnKind::Status, [p](CallContext& ctx, const AbiArgs& a) {
        res::Node& node = ctx.require<res::Node>(a.u32(0));
        const std::size_t index = element_index(a, 1, p.extent);
        std::array<float, 16> values = p.get(node);
        values[index] = a.f32(2);
        p.set(node, values);
        return kOk;
    });
}

// node_{get,set}_{mesh,light,collider}
template <typename T>
void register_attachment(Dispatcher& d, const std::string& name, ResourceId res::Node::*member) {
    d.add("node_get_" + name, ReturnKind::Id, [member](CallContext& ctx, const AbiArgs& a) {
        const res::Node& node = ctx.require<res::Node>(a.u32(0));
        return as_id(ctx.visible(node.*member));
    });

    d.add("node_set_" + name, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        res::Node& node = ctx.require<res::Node>(a.u32(0));
        const ResourceId id = a.u32(1);
        ctx.require<T>(id);
        node.*member = id;
        return kOk;
    });
}

} // namespace

void register_node(Dispatcher& d) {
    d.add("world_create_node", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        marshal::NodeProps props = marshal::decode_node(decoder, a.u32(0));

        res::Node node;
        node.camera = props.camera;
        node.skin = props.skin;
        node.mesh = props.mesh;
        node.translation = scene::vector3_from_array(props.translation);
        node.rotation = scene::quaternion_from_array(props.rotation);
        node.scale = scene::vector3_from_array(props.scale);
        TransformGraph::update_local_matrix(node);

        return as_id(ctx.create(std::move(props.name), std::move(node)).id);
    });

    d.add("world_find_node_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Node>(ctx, a.u32(0), a.u32(1)));
    });

    // --- Hierarchy ---

    d.add("node_add_child", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.bridge().add_child(a.u32(0), a.u32(1));
        return kOk;
    });

    d.add("node_remove_child", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.bridge().remove_child(a.u32(0), a.u32(1));
        return kOk;
    });

    d.add("node_get_child_count", ReturnKind::Count, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.bridge().child_count<res::Node>(a.u32(0)));
    });

    d.add("node_get_child", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.bridge().child_at<res::Node>(a.u32(0), a.u32(1)));
    });

    d.add("node_get_parent", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.bridge().parent_of(a.u32(0)));
    });

    d.add("node_get_parent_scene", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.bridge().parent_scene_of(a.u32(0)));
    });

    // --- Transform ---

    for (const TransformProperty& p : kTransformProperties) {
        register_transform_property(d, p);
    }

    d.add("node_get_world_matrix", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId id = a.u32(0);
        ctx.require<res::Node>(id);
        const auto values = scene::matrix_to_array(ctx.host.graph().world_matrix(id));
        write_floats(ctx, a.u32(1), values);
        return kOk;
    });

    d.add("node_get_world_matrix_element", ReturnKind::Scalar, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId id = a.u32(0);
        ctx.require<res::Node>(id);
        const std::size_t index = element_index(a, 1, 16);
        return static_cast<double>(scene::matrix_to_array(ctx.host.graph().world_matrix(id))[index]);
    });

    // --- Flags ---

    d.add("node_get_visible", ReturnKind::Flag, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(ctx.require<res::Node>(a.u32(0)).visible);
    });

    d.add("node_set_visible", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::Node>(a.u32(0)).visible = a.flag(1);
        return kOk;
    });

    d.add("node_get_is_static", ReturnKind::Flag, [](CallContext& ctx, const AbiArgs& a) {
        return as_flag(ctx.require<res::Node>(a.u32(0)).isStatic);
    });

    d.add("node_set_is_static", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.require<res::Node>(a.u32(0)).isStatic = a.flag(1);
        return kOk;
    });

    d.add("node_set_is_static_recursive", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        ctx.bridge().set_is_static_recursive(a.u32(0), a.flag(1));
        return kOk;
    });

    // --- Attachments ---

    register_attachment<res::Mesh>(d, "mesh", &res::Node::mesh);
    register_attachment<res::Light>(d, "light", &res::Node::light);
    register_attachment<res::Collider>(d, "collider", &res::Node::collider);

    // --- Camera rig ---

    d.add("node_start_orbit", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        const ResourceId id = a.u32(0);
        auto decoder = ctx.decoder();
        const marshal::OrbitProps props = marshal::decode_orbit(decoder, a.u32(1));
        ctx.require<res::Node>(id);

        host::OrbitState& orbit = ctx.host.orbit();
        orbit.active = true;
        orbit.node = id;
        orbit.requestedBy = ctx.env.id;
        orbit.pitch = props.pitch;
        orbit.yaw = props.yaw;
        orbit.zoom = props.zoom;
        return kOk;
    });

    d.add("stop_orbit", ReturnKind::Status, [](CallContext& ctx, const AbiArgs&) {
        ctx.host.orbit() = host::OrbitState{};
        return kOk;
    });
}

} // namespace scriptscene::abi
