#include "decoders.hpp"

namespace scriptscene::marshal {

namespace res = scriptscene::resource;

SceneProps decode_scene(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    SceneProps props;
    props.name = ctx.cursor.read_string_ref();
    return props;
}

NodeProps decode_node(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    NodeProps props;
    props.camera = ctx.read_optional_handle<res::Camera>();
    props.skin = ctx.read_optional_handle<res::Skin>();
    props.mesh = ctx.read_optional_handle<res::Mesh>();
    props.rotation = ctx.cursor.read_f32s<4>();
    props.scale = ctx.cursor.read_f32s<3>();
    props.translation = ctx.cursor.read_f32s<3>();

    // weights (ptr, count)
    ctx.cursor.skip_u32();
    ctx.cursor.skip_u32();

    props.name = ctx.cursor.read_string_ref();
    return props;
}

namespace {

res::MeshPrimitive read_mesh_primitive(DecodeContext& ctx, std::uint32_t index) {
    res::MeshPrimitive primitive;

    const auto [attributesPtr, attributeCount] = ctx.read_array_ref("mesh primitive attribute");
    const std::uint32_t afterAttributes = ctx.cursor.position();

    for (std::uint32_t a = 0; a < attributeCount; ++a) {
        ctx.cursor.move_to(DecodeContext::item_offset(attributesPtr, a, kMeshPrimitiveAttributeByteLength));

        const std::uint32_t rawKey = ctx.cursor.read_u32();
        const auto key = require_enum(res::mesh_primitive_attribute_from(rawKey), rawKey,
                                      "mesh primitive attribute");
        primitive.attributes[static_cast<std::size_t>(key)] = ctx.read_required_handle<res::Accessor>();
    }

    ctx.cursor.move_to(afterAttributes);

    primitive.indices = ctx.read_optional_handle<res::Accessor>();
    primitive.material = ctx.read_optional_handle<res::Material>();

    const std::uint32_t rawMode = ctx.cursor.read_u32();
    primitive.mode = require_enum(res::mesh_primitive_mode_from(rawMode), rawMode,
                                  ("mesh primitive mode (primitive " + std::to_string(index) + ")").c_str());
    return primitive;
}

} // namespace

MeshProps decode_mesh(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    const auto [primitivesPtr, primitiveCount] = ctx.read_array_ref("mesh primitive");

    // weights (ptr, count)
    ctx.cursor.skip_u32();
    ctx.cursor.skip_u32();

    MeshProps props;
    props.name = ctx.cursor.read_string_ref();
    props.primitives.reserve(primitiveCount);

    for (std::uint32_t i = 0; i < primitiveCount; ++i) {
        ctx.cursor.move_to(DecodeContext::item_offset(primitivesPtr, i, kMeshPrimitiveByteLength));
        props.primitives.push_back(read_mesh_primitive(ctx, i));
    }

    return props;
}

BoxMeshProps decode_box_mesh(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    BoxMeshProps props;
    props.size = ctx.cursor.read_f32s<3>();
    props.segments = ctx.cursor.read_u32s<3>();
    props.material = ctx.read_optional_handle<res::Material>();

    for (std::uint32_t s : props.segments) {
        if (s == 0 || s > ctx.limits.max_array_items) {
            throw AbiError(AbiErrorKind::InvalidState, "box mesh segment count out of range");
        }
    }
    return props;
}

AccessorProps decode_accessor(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    AccessorProps props;

    const std::uint32_t rawType = ctx.cursor.read_u32();
    props.type = require_enum(res::accessor_type_from(rawType), rawType, "accessor type");

    const std::uint32_t rawComponent = ctx.cursor.read_u32();
    props.componentType = require_enum(res::accessor_component_type_from(rawComponent), rawComponent,
                                       "accessor component type");

    props.count = ctx.cursor.read_u32();
    props.normalized = ctx.cursor.read_bool();
    props.dynamic = ctx.cursor.read_bool();
    return props;
}

TextureProps decode_texture(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    TextureProps props;
    props.width = ctx.cursor.read_u32();
    props.height = ctx.cursor.read_u32();

    const std::uint32_t rawS = ctx.cursor.read_u32();
    props.wrapS = require_enum(res::texture_wrap_from(rawS), rawS, "texture wrapS");
    const std::uint32_t rawT = ctx.cursor.read_u32();
    props.wrapT = require_enum(res::texture_wrap_from(rawT), rawT, "texture wrapT");

    if (props.width == 0 || props.height == 0) {
        throw AbiError(AbiErrorKind::InvalidState, "texture has zero extent");
    }
    return props;
}

namespace {

void apply_texture_extensions(res::TextureRef& ref, const ExtensionMap& extensions) {
    auto it = extensions.find("KHR_texture_transform");
    if (it == extensions.end()) return;

    if (const auto* transform = std::get_if<res::TextureTransform>(&it->second)) {
        ref.transform = *transform;
    }
}

} // namespace

res::TextureRef read_texture_info(DecodeContext& ctx) {
    res::TextureRef ref;
    ref.texture = ctx.read_optional_handle<res::Texture>();
    ctx.cursor.skip_u32();  // texCoord

    apply_texture_extensions(ref, ExtensionRegistry::texture_info().read_block(ctx));
    ctx.cursor.skip_extras();
    return ref;
}

res::TextureRef read_scaled_texture_info(DecodeContext& ctx) {
    res::TextureRef ref;
    ref.texture = ctx.read_optional_handle<res::Texture>();
    ctx.cursor.skip_u32();  // texCoord
    ref.scale = ctx.cursor.read_f32();

    apply_texture_extensions(ref, ExtensionRegistry::texture_info().read_block(ctx));
    ctx.cursor.skip_extras();
    return ref;
}

MaterialProps decode_material(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    MaterialProps props;
    res::Material& m = props.material;

    m.baseColorFactor = ctx.cursor.read_f32s<4>();
    m.baseColorTexture = read_texture_info(ctx);
    m.metallicFactor = ctx.cursor.read_f32();
    m.roughnessFactor = ctx.cursor.read_f32();
    m.metallicRoughnessTexture = read_texture_info(ctx);
    m.normalTexture = read_scaled_texture_info(ctx);
    m.occlusionTexture = read_scaled_texture_info(ctx);
    m.emissiveTexture = read_texture_info(ctx);
    m.emissiveFactor = ctx.cursor.read_f32s<3>();

    const std::uint32_t rawAlpha = ctx.cursor.read_u32();
    m.alphaMode = require_enum(res::alpha_mode_from(rawAlpha), rawAlpha, "alpha mode");
    m.alphaCutoff = ctx.cursor.read_f32();
    m.doubleSided = ctx.cursor.read_bool();

    props.name = ctx.cursor.read_string_ref();

    const ExtensionMap extensions = ExtensionRegistry::material().read_block(ctx);
    m.type = extensions.count("KHR_materials_unlit") ? res::MaterialType::Unlit : res::MaterialType::Standard;

    ctx.cursor.skip_extras();
    return props;
}

res::Collider decode_collider(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    res::Collider collider;

    const std::uint32_t rawType = ctx.cursor.read_u32();
    collider.type = require_enum(res::collider_type_from(rawType), rawType, "collider type");
    collider.isTrigger = ctx.cursor.read_bool();
    collider.size = ctx.cursor.read_f32s<3>();
    collider.radius = ctx.cursor.read_f32();
    collider.height = ctx.cursor.read_f32();
    collider.mesh = ctx.read_optional_handle<res::Mesh>();

    if ((collider.type == res::ColliderType::Hull || collider.type == res::ColliderType::Trimesh) &&
        collider.mesh == kNullResource) {
        throw AbiError(AbiErrorKind::InvalidState, "hull and trimesh colliders need a mesh");
    }
    return collider;
}

physics::RigidBodyDesc decode_physics_body(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    physics::RigidBodyDesc desc;

    const std::uint32_t rawType = ctx.cursor.read_u32();
    desc.type = require_enum(res::physics_body_type_from(rawType), rawType, "physics body type");

    const auto linear = ctx.cursor.read_f32s<3>();
    const auto angular = ctx.cursor.read_f32s<3>();
    desc.linearVelocity = Vector3{linear[0], linear[1], linear[2]};
    desc.angularVelocity = Vector3{angular[0], angular[1], angular[2]};
    return desc;
}

res::UICanvas decode_ui_canvas(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    res::UICanvas canvas;
    canvas.size = ctx.cursor.read_f32s<2>();
    canvas.width = ctx.cursor.read_f32();
    canvas.height = ctx.cursor.read_f32();
    return canvas;
}

res::UIElement decode_ui_flex(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    res::UIElement flex;
    flex.width = ctx.cursor.read_f32();
    flex.height = ctx.cursor.read_f32();

    const std::uint32_t rawDirection = ctx.cursor.read_u32();
    flex.flexDirection = require_enum(res::flex_direction_from(rawDirection), rawDirection, "flex direction");

    flex.backgroundColor = ctx.cursor.read_f32s<4>();
    flex.borderColor = ctx.cursor.read_f32s<4>();
    flex.padding = ctx.cursor.read_f32s<4>();
    flex.margin = ctx.cursor.read_f32s<4>();
    return flex;
}

res::UIText decode_ui_text(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    res::UIText text;
    text.fontSize = ctx.cursor.read_f32();
    text.color = ctx.cursor.read_f32s<4>();
    text.value = ctx.cursor.read_string_ref();
    text.fontFamily = ctx.cursor.read_string_ref();
    text.fontWeight = ctx.cursor.read_string_ref();
    text.fontStyle = ctx.cursor.read_string_ref();
    return text;
}

OrbitProps decode_orbit(DecodeContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);

    OrbitProps props;
    props.pitch = ctx.cursor.read_f32();
    props.yaw = ctx.cursor.read_f32();
    props.zoom = ctx.cursor.read_f32();
    return props;
}

void write_interactable_state(CursorView& cursor, std::uint32_t ptr, const res::Interactable& state) {
    cursor.move_to_block(ptr);

    // Validate the whole block before writing any of it.
    cursor.bytes_at(ptr, kInteractableStateByteLength);

    cursor.write_u32(static_cast<std::uint32_t>(state.type));
    cursor.write_u32(state.pressed ? 1u : 0u);
    cursor.write_u32(state.held ? 1u : 0u);
    cursor.write_u32(state.released ? 1u : 0u);
}

} // namespace scriptscene::marshal
