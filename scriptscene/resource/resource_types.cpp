#include "resource_types.hpp"

namespace scriptscene::resource {

const char* resource_type_name(ResourceType type) {
    switch (type) {
        case ResourceType::Node: return "Node";
        case ResourceType::Scene: return "Scene";
        case ResourceType::Mesh: return "Mesh";
        case ResourceType::MeshPrimitive: return "MeshPrimitive";
        case ResourceType::Accessor: return "Accessor";
        case ResourceType::Buffer: return "Buffer";
        case ResourceType::BufferView: return "BufferView";
        case ResourceType::Material: return "Material";
        case ResourceType::Texture: return "Texture";
        case ResourceType::Light: return "Light";
        case ResourceType::Camera: return "Camera";
        case ResourceType::Skin: return "Skin";
        case ResourceType::Collider: return "Collider";
        case ResourceType::Interactable: return "Interactable";
        case ResourceType::UICanvas: return "UICanvas";
        case ResourceType::UIElement: return "UIElement";
        case ResourceType::UIButton: return "UIButton";
        case ResourceType::UIText: return "UIText";
    }
    return "Unknown";
}

std::optional<MeshPrimitiveAttribute> mesh_primitive_attribute_from(std::uint32_t raw) {
    if (raw < kMeshPrimitiveAttributeCount) {
        return static_cast<MeshPrimitiveAttribute>(raw);
    }
    return std::nullopt;
}

std::optional<MeshPrimitiveMode> mesh_primitive_mode_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(MeshPrimitiveMode::TriangleFan)) {
        return static_cast<MeshPrimitiveMode>(raw);
    }
    return std::nullopt;
}

std::optional<AlphaMode> alpha_mode_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(AlphaMode::Mask)) {
        return static_cast<AlphaMode>(raw);
    }
    return std::nullopt;
}

std::optional<ColliderType> collider_type_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(ColliderType::Trimesh)) {
        return static_cast<ColliderType>(raw);
    }
    return std::nullopt;
}

std::optional<PhysicsBodyType> physics_body_type_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(PhysicsBodyType::Rigid)) {
        return static_cast<PhysicsBodyType>(raw);
    }
    return std::nullopt;
}

std::optional<InteractableType> interactable_type_from(std::uint32_t raw) {
    if (raw >= static_cast<std::uint32_t>(InteractableType::Interactable) &&
        raw <= static_cast<std::uint32_t>(InteractableType::UI)) {
        return static_cast<InteractableType>(raw);
    }
    return std::nullopt;
}

std::optional<LightType> light_type_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(LightType::Spot)) {
        return static_cast<LightType>(raw);
    }
    return std::nullopt;
}

std::optional<AccessorType> accessor_type_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(AccessorType::Mat4)) {
        return static_cast<AccessorType>(raw);
    }
    return std::nullopt;
}

std::optional<AccessorComponentType> accessor_component_type_from(std::uint32_t raw) {
    switch (raw) {
        case 5120:
        case 5121:
        case 5122:
        case 5123:
        case 5125:
        case 5126:
            return static_cast<AccessorComponentType>(raw);
        default:
            return std::nullopt;
    }
}

std::optional<TextureWrap> texture_wrap_from(std::uint32_t raw) {
    switch (raw) {
        case 33071:
        case 33648:
        case 10497:
            return static_cast<TextureWrap>(raw);
        default:
            return std::nullopt;
    }
}

std::optional<FlexDirection> flex_direction_from(std::uint32_t raw) {
    if (raw <= static_cast<std::uint32_t>(FlexDirection::RowReverse)) {
        return static_cast<FlexDirection>(raw);
    }
    return std::nullopt;
}

std::uint32_t accessor_type_element_size(AccessorType type) {
    switch (type) {
        case AccessorType::Scalar: return 1;
        case AccessorType::Vec2: return 2;
        case AccessorType::Vec3: return 3;
        case AccessorType::Vec4: return 4;
        case AccessorType::Mat2: return 4;
        case AccessorType::Mat3: return 9;
        case AccessorType::Mat4: return 16;
    }
    return 1;
}

std::uint32_t accessor_component_byte_size(AccessorComponentType type) {
    switch (type) {
        case AccessorComponentType::Int8:
        case AccessorComponentType::Uint8:
            return 1;
        case AccessorComponentType::Int16:
        case AccessorComponentType::Uint16:
            return 2;
        case AccessorComponentType::Uint32:
        case AccessorComponentType::Float32:
            return 4;
    }
    return 1;
}

} // namespace scriptscene::resource
