#include "handler_support.hpp"

#include "../marshal/decoders.hpp"

#include <vector>

namespace scriptscene::abi {

namespace res = scriptscene::resource;
using namespace detail;

namespace {

// {get,set} pair for a fixed-size float array member, written to / read from
// guest memory at the pointer argument.
template <typename T, std::size_t N>
void register_float_array(Dispatcher& d, const std::string& getName, const std::string& setName,
                          std::array<float, N> T::*member) {
    d.add(getName, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        const T& owner = ctx.require<T>(a.u32(0));
        write_floats(ctx, a.u32(1), owner.*member);
        return kOk;
    });

    d.add(setName, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        T& owner = ctx.require<T>(a.u32(0));
        owner.*member = read_floats<N>(ctx, a.u32(1));
        return kOk;
    });
}

// {get,set} pair for a float member passed by value. Getters report 0 on error.
template <typename T>
void register_float(Dispatcher& d, const std::string& getName, const std::string& setName, float T::*member) {
    d.add(getName, ReturnKind::Scalar, 0.0, [member](CallContext& ctx, const AbiArgs& a) {
        return static_cast<double>(ctx.require<T>(a.u32(0)).*member);
    });

    d.add(setName, ReturnKind::Status, [member](CallContext& ctx, const AbiArgs& a) {
        ctx.require<T>(a.u32(0)).*member = a.f32(1);
        return kOk;
    });
}

} // namespace

void register_material_texture_light(Dispatcher& d) {
    // --- Materials ---

    d.add("world_create_material", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        auto decoder = ctx.decoder();
        marshal::MaterialProps props = marshal::decode_material(decoder, a.u32(0));
        return as_id(ctx.create(std::move(props.name), std::move(props.material)).id);
    });

    d.add("world_find_material_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Material>(ctx, a.u32(0), a.u32(1)));
    });

    register_float_array(d, "material_get_base_color_factor", "material_set_base_color_factor",
                         &res::Material::baseColorFactor);
    register_float_array(d, "material_get_emissive_factor", "material_set_emissive_factor",
                         &res::Material::emissiveFactor);
    register_float(d, "material_get_metallic_factor", "material_set_metallic_factor",
                   &res::Material::metallicFactor);
    register_float(d, "material_get_roughness_factor", "material_set_roughness_factor",
                   &res::Material::roughnessFactor);

    d.add("material_get_base_color_texture", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        const res::Material& material = ctx.require<res::Material>(a.u32(0));
        return as_id(ctx.visible(material.baseColorTexture.texture));
    });

    d.add("material_set_base_color_texture", ReturnKind::Status, [](CallContext& ctx, const AbiArgs& a) {
        res::Material& material = ctx.require<res::Material>(a.u32(0));
        const ResourceId texture = a.u32(1);
        ctx.require<res::Texture>(texture);
        material.baseColorTexture.texture = texture;
        return kOk;
    });

    // --- Textures ---

    // (dataPtr, byteLength, propsPtr); data is tightly packed RGBA8.
    d.add("world_create_texture_from", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        const std::uint32_t dataPtr = a.u32(0);
        const std::uint32_t byteLength = a.u32(1);

        auto decoder = ctx.decoder();
        const marshal::TextureProps props = marshal::decode_texture(decoder, a.u32(2));

        const std::uint64_t expected = static_cast<std::uint64_t>(props.width) * props.height * 4;
        if (byteLength != expected) {
            throw AbiError(AbiErrorKind::InvalidState,
                           "texture data is " + std::to_string(byteLength) + " bytes, expected " +
                           std::to_string(expected));
        }

        const auto bytes = ctx.cursor.bytes_at(dataPtr, byteLength);

        res::Texture texture;
        texture.width = props.width;
        texture.height = props.height;
        texture.wrapS = props.wrapS;
        texture.wrapT = props.wrapT;
        texture.pixels.assign(bytes.begin(), bytes.end());
        return as_id(ctx.create("", std::move(texture)).id);
    });

    d.add("texture_find_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Texture>(ctx, a.u32(0), a.u32(1)));
    });

    // --- Lights ---

    d.add("create_light", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        const std::uint32_t raw = a.u32(0);
        res::Light light;
        light.type = marshal::require_enum(res::light_type_from(raw), raw, "light type");
        return as_id(ctx.create("", light).id);
    });

    d.add("light_find_by_name", ReturnKind::Id, [](CallContext& ctx, const AbiArgs& a) {
        return as_id(find_by_name<res::Light>(ctx, a.u32(0), a.u32(1)));
    });

    register_float_array(d, "light_get_color", "light_set_color", &res::Light::color);
    register_float(d, "light_get_intensity", "light_set_intensity", &res::Light::intensity);
}

} // namespace scriptscene::abi
