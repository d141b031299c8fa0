#pragma once

#include "decode_context.hpp"
#include "extensions.hpp"
#include "../physics/physics_world.hpp"
#include "../resource/resources.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace scriptscene::marshal {

// =============================================================================
// Block sizes (bytes)
// =============================================================================

static constexpr std::uint32_t kSceneBlockByteLength = 8;
static constexpr std::uint32_t kNodeBlockByteLength = 68;
static constexpr std::uint32_t kMeshBlockByteLength = 24;
static constexpr std::uint32_t kMeshPrimitiveByteLength = 20;
static constexpr std::uint32_t kMeshPrimitiveAttributeByteLength = 8;
static constexpr std::uint32_t kBoxMeshBlockByteLength = 28;
static constexpr std::uint32_t kAccessorBlockByteLength = 20;
static constexpr std::uint32_t kTextureBlockByteLength = 16;
static constexpr std::uint32_t kTextureInfoByteLength = 24;
static constexpr std::uint32_t kScaledTextureInfoByteLength = 28;
static constexpr std::uint32_t kMaterialBlockByteLength = 200;
static constexpr std::uint32_t kColliderBlockByteLength = 32;
static constexpr std::uint32_t kPhysicsBodyBlockByteLength = 28;
static constexpr std::uint32_t kUICanvasBlockByteLength = 16;
static constexpr std::uint32_t kUIFlexBlockByteLength = 76;
static constexpr std::uint32_t kUITextBlockByteLength = 52;
static constexpr std::uint32_t kOrbitBlockByteLength = 12;
static constexpr std::uint32_t kInteractableStateByteLength = 16;

// =============================================================================
// Decoded records
// =============================================================================

struct SceneProps {
    std::string name;
};

struct NodeProps {
    ResourceId camera{kNullResource};
    ResourceId skin{kNullResource};
    ResourceId mesh{kNullResource};
    std::array<float, 4> rotation{0.0f, 0.0f, 0.0f, 1.0f};
    std::array<float, 3> scale{1.0f, 1.0f, 1.0f};
    std::array<float, 3> translation{0.0f, 0.0f, 0.0f};
    std::string name;
};

struct MeshProps {
    std::string name;
    std::vector<resource::MeshPrimitive> primitives;
};

struct BoxMeshProps {
    std::array<float, 3> size{1.0f, 1.0f, 1.0f};
    std::array<std::uint32_t, 3> segments{1, 1, 1};
    ResourceId material{kNullResource};
};

struct AccessorProps {
    resource::AccessorType type{resource::AccessorType::Scalar};
    resource::AccessorComponentType componentType{resource::AccessorComponentType::Float32};
    std::uint32_t count{0};
    bool normalized{false};
    bool dynamic{false};

    std::uint32_t element_byte_length() const {
        return resource::accessor_type_element_size(type) *
               resource::accessor_component_byte_size(componentType);
    }
};

struct TextureProps {
    std::uint32_t width{0};
    std::uint32_t height{0};
    resource::TextureWrap wrapS{resource::TextureWrap::Repeat};
    resource::TextureWrap wrapT{resource::TextureWrap::Repeat};
};

struct MaterialProps {
    std::string name;
    resource::Material material;
};

struct OrbitProps {
    float pitch{0.0f};
    float yaw{0.0f};
    float zoom{1.0f};
};

// =============================================================================
// Decoders
// =============================================================================
//
// Each decoder moves the cursor to `ptr`, reads one block and either returns a
// fully validated record or throws AbiError. Nothing is registered here.

SceneProps decode_scene(DecodeContext& ctx, std::uint32_t ptr);
NodeProps decode_node(DecodeContext& ctx, std::uint32_t ptr);

// Validates every primitive before returning.
MeshProps decode_mesh(DecodeContext& ctx, std::uint32_t ptr);

BoxMeshProps decode_box_mesh(DecodeContext& ctx, std::uint32_t ptr);
AccessorProps decode_accessor(DecodeContext& ctx, std::uint32_t ptr);
TextureProps decode_texture(DecodeContext& ctx, std::uint32_t ptr);
MaterialProps decode_material(DecodeContext& ctx, std::uint32_t ptr);
resource::Collider decode_collider(DecodeContext& ctx, std::uint32_t ptr);
physics::RigidBodyDesc decode_physics_body(DecodeContext& ctx, std::uint32_t ptr);
resource::UICanvas decode_ui_canvas(DecodeContext& ctx, std::uint32_t ptr);
resource::UIElement decode_ui_flex(DecodeContext& ctx, std::uint32_t ptr);
resource::UIText decode_ui_text(DecodeContext& ctx, std::uint32_t ptr);
OrbitProps decode_orbit(DecodeContext& ctx, std::uint32_t ptr);

// Texture info sub-blocks (cursor already positioned).
resource::TextureRef read_texture_info(DecodeContext& ctx);
resource::TextureRef read_scaled_texture_info(DecodeContext& ctx);

// =============================================================================
// Encoders (host -> guest)
// =============================================================================

void write_interactable_state(CursorView& cursor, std::uint32_t ptr, const resource::Interactable& state);

} // namespace scriptscene::marshal
