#include "handler_support.hpp"

#include "../marshal/decoders.hpp"
#include "../scene/box_geometry.hpp"

#include <cstring>
#include <vector>

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;

namespace {

// Vertices a box may generate before it is refused.
constexpr std::uint64_t kMaxBoxVertices = 1u << 20;

// Buffer + BufferView + Accessor over `data`, all owned by the caller.
ResourceId create_accessor(CallContext& ctx, std::vector<std::uint8_t> data, const marshal::AccessorProps& props) {
    const auto byteLength = static_cast<std::uint32_t>(data.size());

    res::Buffer buffer;
    buffer.data = std::move(data);
    const ResourceId bufferId = ctx.create("", std::move(buffer)).id;

    res::BufferView view;
    view.buffer = bufferId;
    view.byteLength = byteLength;
    const ResourceId viewId = ctx.create("", view).id;

    res::Accessor accessor;
    accessor.bufferView = viewId;
    accessor.type = props.type;
    accessor.componentType = props.componentType;
    accessor.count = props.count;
    accessor.normalized = props.normalized;
    accessor.dynamic = props.dynamic;
    return ctx.create("", accessor).id;
}

template <typename T>
std::vector<std::uint8_t> to_bytes(const std::vector<T>& values) {
    std::vector<std::uint8_t> out(values.size() * sizeof(T));
    if (!out.empty()) {
        std::memcpy(out.data(), values.data(), out.size());
    }
    return out;
}

ResourceId create_float_accessor(CallContext& ctx, const std::vector<float>& values, res::AccessorType type,
                                 std::uint32_t components) {
    marshal::AccessorProps props;
    props.type = type;
    props.componentType = res::AccessorComponentType::Float32;
    props.count = static_cast<std::uint32_t>(values.size() / components);
    return create_accessor(ctx, to_bytes(values), props);
}

// Primitive `index` of a granted mesh. Primitives are parts of their mesh and
// are reached through it, not through their own grant.
res::MeshPrimitive& primitive_at(CallContext& ctx, ResourceId meshId, std::uint32_t index) {
    const res::Mesh& mesh = ctx.require<res::Mesh>(meshId);
    if (index >= mesh.primitives.size()) {
        throw AbiError(AbiErrorKind::NotFound,
                       "mesh " + std::to_string(meshId) + " has no primitive " + std::to_string(index));
    }
    auto* primitive = ctx.registry().find_as<res::MeshPrimitive>(mesh.primitives[index]);
    if (!primitive) {
        throw AbiError(AbiErrorKind::NotFound, "mesh primitive " + std::to_string(index) + " is gone");
    }
    return *primitive;
}

} // namespace

void register_mesh_accessor(Dispatcher& d) {
    // Every primitive is validated before anything is registered.
    d.add("world_create_mesh", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        marshal::MeshProps props = marshal::decode_mesh(decoder, a.u32(0));

        res::Mesh mesh;
        mesh.primitives.reserve(props.primitives.size());
        for (res::MeshPrimitive& primitive : props.primitives) {
            mesh.primitives.push_back(ctx.create("", std::move(primitive)).id);
        }
        return as_id(ctx.create(std::move(props.name), std::move(mesh)).id);
    });

    d.add("world_create_box_mesh", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        const marshal::BoxMeshProps props = marshal::decode_box_mesh(decoder, a.u32(0));

        const std::uint64_t sx = props.segments[0] + 1ull;
        const std::uint64_t sy = props.segments[1] + 1ull;
        const std::uint64_t sz = props.segments[2] + 1ull;
        if (2 * (sz * sy + sx * sz + sx * sy) > kMaxBoxVertices) {
            throw AbiError(AbiErrorKind::InvalidState, "box mesh has too many segments");
        }

        const scene::BoxGeometry geometry = scene::build_box_geometry(props.size, props.segments);

        res::MeshPrimitive primitive;
        primitive.attributes[static_cast<std::size_t>(res::MeshPrimitiveAttribute::Position)] =
            create_float_accessor(ctx, geometry.positions, res::AccessorType::Vec3, 3);
        primitive.attributes[static_cast<std::size_t>(res::MeshPrimitiveAttribute::Normal)] =
            create_float_accessor(ctx, geometry.normals, res::AccessorType::Vec3, 3);
        primitive.attributes[static_cast<std::size_t>(res::MeshPrimitiveAttribute::Texcoord0)] =
            create_float_accessor(ctx, geometry.texcoords, res::AccessorType::Vec2, 2);

        marshal::AccessorProps indexProps;
        indexProps.type = res::AccessorType::Scalar;
        indexProps.componentType = res::AccessorComponentType::Uint32;
        indexProps.count = static_cast<std::uint32_t>(geometry.indices.size());
        primitive.indices = create_accessor(ctx, to_bytes(geometry.indices), indexProps);

        primitive.material = props.material;
        primitive.mode = res::MeshPrimitiveMode::Triangles;
        primitive.ownsAccessors = true;

        res::Mesh mesh;
        mesh.primitives.push_back(ctx.create("", primitive).id);
        return as_id(ctx.create("", std::move(mesh)).id);
    });

    d.add("world_find_mesh_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Mesh>(ctx, a.u32(0), a.u32(1)));
    });

    d.add("mesh_get_primitive_count", ReturnKind::Count, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.require<res::Mesh>(a.u32(0)).primitives.size());
    });

    d.add("mesh_get_primitive_attribute", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        const res::MeshPrimitive& primitive = primitive_at(ctx, a.u32(0), a.u32(1));
        const std::uint32_t raw = a.u32(2);
        const auto key = marshal::require_enum(res::mesh_primitive_attribute_from(raw), raw,
                                               "mesh primitive attribute");
        return as_id(ctx.visible(primitive.attributes[static_cast<std::size_t>(key)]));
    });

    d.add("mesh_get_primitive_indices", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.visible(primitive_at(ctx, a.u32(0), a.u32(1)).indices));
    });

    d.add("mesh_get_primitive_material", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(ctx.visible(primitive_at(ctx, a.u32(0), a.u32(1)).material));
    });

    d.add("mesh_set_primitive_material", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::MeshPrimitive& primitive = primitive_at(ctx, a.u32(0), a.u32(1));
        const ResourceId material = a.u32(2);
        ctx.require<res::Material>(material);
        primitive.material = material;
        return kOk;
    });

    d.add("mesh_set_primitive_hologram_material_enabled", ReturnKind::Status,
          [](CallContext& ctx, const AbiArgs& a) {
        primitive_at(ctx, a.u32(0), a.u32(1)).hologramMaterialEnabled = a.flag(2);
        return kOk;
    });

    d.add("mesh_get_primitive_mode", ReturnKind::Scalar, 0.0, [](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(primitive_at(ctx, a.u32(0), a.u32(1)).mode);
    });

    d.add("mesh_set_primitive_draw_range", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::MeshPrimitive& primitive = primitive_at(ctx, a.u32(0), a.u32(1));
        primitive.drawStart = a.u32(2);
        primitive.drawCount = a.u32(3);
        return kOk;
    });

    // --- Accessors ---

    d.add("world_create_accessor_from", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        const std::uint32_t dataPtr = a.u32(0);
        const std::uint32_t byteLength = a.u32(1);

        auto decoder = ctx.decoder();
        const marshal::AccessorProps props = marshal::decode_accessor(decoder, a.u32(2));

        const std::uint64_t needed = static_cast<std::uint64_t>(props.count) * props.element_byte_length();
        if (byteLength < needed) {
            throw AbiError(AbiErrorKind::InvalidState,
                           "accessor data of " + std::to_string(byteLength) + " bytes is shorter than " +
                           std::to_string(needed));
        }

        const auto bytes = ctx.cursor.bytes_at(dataPtr, byteLength);
        return as_id(create_accessor(ctx, std::vector<std::uint8_t>(bytes.begin(), bytes.end()), props));
    });

    d.add("world_find_accessor_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Accessor>(ctx, a.u32(0), a.u32(1)));
    });

    d.add("accessor_update_with", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::Accessor& accessor = ctx.require<res::Accessor>(a.u32(0));
        const std::uint32_t dataPtr = a.u32(1);
        const std::uint32_t byteLength = a.u32(2);

        if (!accessor.dynamic) {
            throw AbiError(AbiErrorKind::InvalidState, "cannot update non-dynamic accessor");
        }
        if (accessor.sparse) {
            throw AbiError(AbiErrorKind::InvalidState, "cannot update sparse accessor");
        }

        const auto* view = ctx.registry().find_as<res::BufferView>(accessor.bufferView);
        auto* buffer = view ? ctx.registry().find_as<res::Buffer>(view->buffer) : nullptr;
        if (!view || !buffer) {
            throw AbiError(AbiErrorKind::InvalidState, "cannot update accessor without a buffer view");
        }

        const std::uint32_t elementByteLength =
            res::accessor_type_element_size(accessor.type) * res::accessor_component_byte_size(accessor.componentType);
        if (view->byteStride != 0 && view->byteStride != elementByteLength) {
            throw AbiError(AbiErrorKind::InvalidState, "cannot update interleaved accessor");
        }

        const std::uint64_t offset = static_cast<std::uint64_t>(accessor.byteOffset) + view->byteOffset;
        const std::uint64_t writable = static_cast<std::uint64_t>(accessor.count) * elementByteLength;
        if (offset + writable > buffer->data.size()) {
            throw AbiError(AbiErrorKind::InvalidState, "accessor range exceeds its buffer");
        }
        if (byteLength > writable) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "update of " + std::to_string(byteLength) + " bytes exceeds accessor size " +
                           std::to_string(writable));
        }

        const auto source = ctx.cursor.bytes_at(dataPtr, byteLength);
        if (!source.empty()) {
            std::memcpy(buffer->data.data() + offset, source.data(), source.size());
        }
        ++accessor.version;
        return kOk;
    });
}

} // namespace scriptscene::abi
