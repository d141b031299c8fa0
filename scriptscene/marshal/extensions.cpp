#include "extensions.hpp"

#include "../core/logger.hpp"

namespace scriptscene::marshal {

void ExtensionRegistry::add(std::string name, Decoder decoder) {
    decoders_[std::move(name)] = std::move(decoder);
}

ExtensionMap ExtensionRegistry::read_block(DecodeContext& ctx) const {
    const auto [itemsPtr, count] = ctx.read_array_ref("extension");
    const std::uint32_t resume = ctx.cursor.position();

    ExtensionMap out;

    for (std::uint32_t i = 0; i < count; ++i) {
        ctx.cursor.move_to(DecodeContext::item_offset(itemsPtr, i, kExtensionItemByteLength));

        std::string name = ctx.cursor.read_string_ref();
        const std::uint32_t valuePtr = ctx.cursor.read_u32();

        auto it = decoders_.find(name);
        if (it == decoders_.end()) {
            core::logf(LogLevel::Debug, "decode", "ignoring unknown extension '%s'", name.c_str());
            out[std::move(name)] = std::monostate{};
            continue;
        }

        if (valuePtr == 0) {
            out[std::move(name)] = std::monostate{};
            continue;
        }

        ctx.cursor.move_to(valuePtr);
        out[std::move(name)] = it->second(ctx);
    }

    ctx.cursor.move_to(resume);
    return out;
}

const ExtensionRegistry& ExtensionRegistry::material() {
    static const ExtensionRegistry registry = [] {
        ExtensionRegistry r;
        r.add("KHR_materials_unlit", [](DecodeContext&) -> ExtensionRecord {
            return UnlitExtension{};
        });
        return r;
    }();
    return registry;
}

const ExtensionRegistry& ExtensionRegistry::texture_info() {
    static const ExtensionRegistry registry = [] {
        ExtensionRegistry r;
        r.add("KHR_texture_transform", [](DecodeContext& ctx) -> ExtensionRecord {
            resource::TextureTransform t;
            t.offset = ctx.cursor.read_f32s<2>();
            t.rotation = ctx.cursor.read_f32();
            t.scale = ctx.cursor.read_f32s<2>();
            t.texCoord = ctx.cursor.read_u32();
            return t;
        });
        return r;
    }();
    return registry;
}

} // namespace scriptscene::marshal
