#pragma once

#include <cstdint>
#include <optional>

namespace scriptscene::resource {

// ============================================================================
// Resource kinds
// ============================================================================
// Order matches the alternatives of ResourceData.

enum class ResourceType : std::uint8_t {
    Node,
    Scene,
    Mesh,
    MeshPrimitive,
    Accessor,
    Buffer,
    BufferView,
    Material,
    Texture,
    Light,
    Camera,
    Skin,
    Collider,
    Interactable,
    UICanvas,
    UIElement,
    UIButton,
    UIText,
};

const char* resource_type_name(ResourceType type);

// ============================================================================
// Enumerations carried in parameter blocks
// ============================================================================

enum class MeshPrimitiveAttribute : std::uint32_t {
    Position = 0,
    Normal = 1,
    Tangent = 2,
    Texcoord0 = 3,
    Texcoord1 = 4,
    Color0 = 5,
    Joints0 = 6,
    Weights0 = 7,
};

static constexpr std::uint32_t kMeshPrimitiveAttributeCount = 8;

enum class MeshPrimitiveMode : std::uint32_t {
    Points = 0,
    Lines = 1,
    LineLoop = 2,
    LineStrip = 3,
    Triangles = 4,
    TriangleStrip = 5,
    TriangleFan = 6,
};

enum class AlphaMode : std::uint32_t {
    Opaque = 0,
    Blend = 1,
    Mask = 2,
};

enum class MaterialType : std::uint8_t {
    Standard,
    Unlit,
};

enum class ColliderType : std::uint32_t {
    Box = 0,
    Sphere = 1,
    Capsule = 2,
    Cylinder = 3,
    Hull = 4,
    Trimesh = 5,
};

enum class PhysicsBodyType : std::uint32_t {
    Static = 0,
    Kinematic = 1,
    Rigid = 2,
};

enum class InteractableType : std::uint32_t {
    Interactable = 1,
    Grabbable = 2,
    Player = 3,
    Portal = 4,
    UI = 5,
};

enum class LightType : std::uint32_t {
    Directional = 0,
    Point = 1,
    Spot = 2,
};

enum class AccessorType : std::uint32_t {
    Scalar = 0,
    Vec2 = 1,
    Vec3 = 2,
    Vec4 = 3,
    Mat2 = 4,
    Mat3 = 5,
    Mat4 = 6,
};

enum class AccessorComponentType : std::uint32_t {
    Int8 = 5120,
    Uint8 = 5121,
    Int16 = 5122,
    Uint16 = 5123,
    Uint32 = 5125,
    Float32 = 5126,
};

enum class TextureWrap : std::uint32_t {
    ClampToEdge = 33071,
    MirroredRepeat = 33648,
    Repeat = 10497,
};

enum class FlexDirection : std::uint32_t {
    Column = 0,
    ColumnReverse = 1,
    Row = 2,
    RowReverse = 3,
};

// ============================================================================
// Raw value -> enum (nullopt for unknown values)
// ============================================================================

std::optional<MeshPrimitiveAttribute> mesh_primitive_attribute_from(std::uint32_t raw);
std::optional<MeshPrimitiveMode> mesh_primitive_mode_from(std::uint32_t raw);
std::optional<AlphaMode> alpha_mode_from(std::uint32_t raw);
std::optional<ColliderType> collider_type_from(std::uint32_t raw);
std::optional<PhysicsBodyType> physics_body_type_from(std::uint32_t raw);
std::optional<InteractableType> interactable_type_from(std::uint32_t raw);
std::optional<LightType> light_type_from(std::uint32_t raw);
std::optional<AccessorType> accessor_type_from(std::uint32_t raw);
std::optional<AccessorComponentType> accessor_component_type_from(std::uint32_t raw);
std::optional<TextureWrap> texture_wrap_from(std::uint32_t raw);
std::optional<FlexDirection> flex_direction_from(std::uint32_t raw);

// Components per element (SCALAR=1 ... MAT4=16).
std::uint32_t accessor_type_element_size(AccessorType type);

// Bytes per component.
std::uint32_t accessor_component_byte_size(AccessorComponentType type);

} // namespace scriptscene::resource
