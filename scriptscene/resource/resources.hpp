#pragma once

#include "resource_types.hpp"
#include "../core/types.hpp"

#include <raylib.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace scriptscene::resource {

// =============================================================================
// Resource payloads
// =============================================================================
//
// Payloads are plain data. Links between resources are ResourceIds (0 = none);
// the registry owns every payload and nothing holds a pointer across calls.

struct Node {
    // Hierarchy (intrusive sibling chains)
    ResourceId parent{kNullResource};
    ResourceId parentScene{kNullResource};
    ResourceId firstChild{kNullResource};
    ResourceId nextSibling{kNullResource};
    ResourceId prevSibling{kNullResource};

    // Attachments
    ResourceId camera{kNullResource};
    ResourceId skin{kNullResource};
    ResourceId mesh{kNullResource};
    ResourceId light{kNullResource};
    ResourceId collider{kNullResource};
    ResourceId interactable{kNullResource};
    ResourceId uiCanvas{kNullResource};

    // Local transform. TRS and the local matrix are kept in sync by the
    // transform graph; whichever was written last is stored verbatim.
    Vector3 translation{0.0f, 0.0f, 0.0f};
    Quaternion rotation{0.0f, 0.0f, 0.0f, 1.0f};
    Vector3 scale{1.0f, 1.0f, 1.0f};
    Matrix localMatrix{1.0f, 0.0f, 0.0f, 0.0f,
                       0.0f, 1.0f, 0.0f, 0.0f,
                       0.0f, 0.0f, 1.0f, 0.0f,
                       0.0f, 0.0f, 0.0f, 1.0f};

    bool visible{true};
    bool isStatic{false};
};

struct Scene {
    ResourceId firstNode{kNullResource};
};

struct Mesh {
    std::vector<ResourceId> primitives;
};

struct MeshPrimitive {
    std::array<ResourceId, kMeshPrimitiveAttributeCount> attributes{};
    ResourceId indices{kNullResource};
    ResourceId material{kNullResource};
    MeshPrimitiveMode mode{MeshPrimitiveMode::Triangles};
    bool hologramMaterialEnabled{false};
    std::uint32_t drawStart{0};
    std::uint32_t drawCount{0};

    // Set when the host built the accessors for this primitive; they are then
    // released together with it.
    bool ownsAccessors{false};
};

struct Buffer {
    std::vector<std::uint8_t> data;
};

struct BufferView {
    ResourceId buffer{kNullResource};
    std::uint32_t byteOffset{0};
    std::uint32_t byteLength{0};
    std::uint32_t byteStride{0};
};

struct Accessor {
    ResourceId bufferView{kNullResource};
    std::uint32_t byteOffset{0};
    AccessorType type{AccessorType::Scalar};
    AccessorComponentType componentType{AccessorComponentType::Float32};
    std::uint32_t count{0};
    bool normalized{false};
    bool dynamic{false};
    bool sparse{false};
    std::uint32_t version{0};
};

struct TextureTransform {
    std::array<float, 2> offset{0.0f, 0.0f};
    float rotation{0.0f};
    std::array<float, 2> scale{1.0f, 1.0f};
    std::uint32_t texCoord{0};
};

// Texture slot of a material. `scale` is the normal scale or occlusion
// strength for the slots that carry one.
struct TextureRef {
    ResourceId texture{kNullResource};
    float scale{1.0f};
    std::optional<TextureTransform> transform;
};

struct Material {
    MaterialType type{MaterialType::Standard};
    std::array<float, 4> baseColorFactor{1.0f, 1.0f, 1.0f, 1.0f};
    TextureRef baseColorTexture;
    float metallicFactor{1.0f};
    float roughnessFactor{1.0f};
    TextureRef metallicRoughnessTexture;
    TextureRef normalTexture;
    TextureRef occlusionTexture;
    TextureRef emissiveTexture;
    std::array<float, 3> emissiveFactor{0.0f, 0.0f, 0.0f};
    AlphaMode alphaMode{AlphaMode::Opaque};
    float alphaCutoff{0.5f};
    bool doubleSided{false};
};

struct Texture {
    std::uint32_t width{0};
    std::uint32_t height{0};
    TextureWrap wrapS{TextureWrap::Repeat};
    TextureWrap wrapT{TextureWrap::Repeat};
    std::vector<std::uint8_t> pixels;  // RGBA8
};

struct Light {
    LightType type{LightType::Directional};
    std::array<float, 3> color{1.0f, 1.0f, 1.0f};
    float intensity{1.0f};
};

struct Camera {
    float yfov{0.8f};
    float znear{0.1f};
    float zfar{1000.0f};
};

struct Skin {
    std::vector<ResourceId> joints;
};

struct Collider {
    ColliderType type{ColliderType::Box};
    bool isTrigger{false};
    std::array<float, 3> size{1.0f, 1.0f, 1.0f};
    float radius{0.5f};
    float height{1.0f};
    ResourceId mesh{kNullResource};
};

struct Interactable {
    InteractableType type{InteractableType::Interactable};
    ResourceId target{kNullResource};  // node or UI button carrying it
    bool pressed{false};
    bool held{false};
    bool released{false};
};

struct UICanvas {
    std::array<float, 2> size{1.0f, 1.0f};
    float width{256.0f};
    float height{256.0f};
    ResourceId root{kNullResource};
    std::uint32_t redraw{0};
    ResourceId mountedOn{kNullResource};  // node whose body and marker the mount created
};

struct UIElement {
    float width{0.0f};
    float height{0.0f};
    FlexDirection flexDirection{FlexDirection::Column};
    std::array<float, 4> backgroundColor{0.0f, 0.0f, 0.0f, 0.0f};
    std::array<float, 4> borderColor{0.0f, 0.0f, 0.0f, 0.0f};
    std::array<float, 4> padding{0.0f, 0.0f, 0.0f, 0.0f};
    std::array<float, 4> margin{0.0f, 0.0f, 0.0f, 0.0f};

    ResourceId parent{kNullResource};
    ResourceId firstChild{kNullResource};
    ResourceId nextSibling{kNullResource};
    ResourceId prevSibling{kNullResource};

    ResourceId text{kNullResource};
    ResourceId button{kNullResource};
};

struct UIButton {
    std::string label;
    ResourceId interactable{kNullResource};
};

struct UIText {
    std::string value;
    float fontSize{12.0f};
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 1.0f};
    std::string fontFamily;
    std::string fontWeight;
    std::string fontStyle;
};

using ResourceData = std::variant<
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
    UIText>;

// =============================================================================
// Payload -> ResourceType
// =============================================================================

template <typename T>
struct ResourceTraits;

#define SCRIPTSCENE_RESOURCE_TRAITS(Payload)                         \
    template <>                                                      \
    struct ResourceTraits<Payload> {                                 \
        static constexpr ResourceType type = ResourceType::Payload;  \
    }

SCRIPTSCENE_RESOURCE_TRAITS(Node);
SCRIPTSCENE_RESOURCE_TRAITS(Scene);
SCRIPTSCENE_RESOURCE_TRAITS(Mesh);
SCRIPTSCENE_RESOURCE_TRAITS(MeshPrimitive);
SCRIPTSCENE_RESOURCE_TRAITS(Accessor);
SCRIPTSCENE_RESOURCE_TRAITS(Buffer);
SCRIPTSCENE_RESOURCE_TRAITS(BufferView);
SCRIPTSCENE_RESOURCE_TRAITS(Material);
SCRIPTSCENE_RESOURCE_TRAITS(Texture);
SCRIPTSCENE_RESOURCE_TRAITS(Light);
SCRIPTSCENE_RESOURCE_TRAITS(Camera);
SCRIPTSCENE_RESOURCE_TRAITS(Skin);
SCRIPTSCENE_RESOURCE_TRAITS(Collider);
SCRIPTSCENE_RESOURCE_TRAITS(Interactable);
SCRIPTSCENE_RESOURCE_TRAITS(UICanvas);
SCRIPTSCENE_RESOURCE_TRAITS(UIElement);
SCRIPTSCENE_RESOURCE_TRAITS(UIButton);
SCRIPTSCENE_RESOURCE_TRAITS(UIText);

#undef SCRIPTSCENE_RESOURCE_TRAITS

// =============================================================================
// Resource
// =============================================================================

struct Resource {
    ResourceId id{kNullResource};
    RegistrationSerial serial{0};
    std::string name;
    EnvironmentId owner{kHostOwner};
    ResourceData data;

    ResourceType type() const {
        return std::visit([](const auto& payload) {
            return ResourceTraits<std::decay_t<decltype(payload)>>::type;
        }, data);
    }

    template <typename T>
    T* as() { return std::get_if<T>(&data); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&data); }
};

} // namespace scriptscene::resource
