#pragma once

#include "decode_context.hpp"
#include "../resource/resources.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <variant>

namespace scriptscene::marshal {

// Stride of one (namePtr, nameLength, valuePtr) item.
static constexpr std::uint32_t kExtensionItemByteLength = 12;

struct UnlitExtension {};

// Decoded extension value; monostate for names nobody handles.
using ExtensionRecord = std::variant<std::monostate, UnlitExtension, resource::TextureTransform>;

using ExtensionMap = std::unordered_map<std::string, ExtensionRecord>;

// Name -> decoder table for one extension block kind.
class ExtensionRegistry {
public:
    using Decoder = std::function<ExtensionRecord(DecodeContext&)>;

    void add(std::string name, Decoder decoder);
    bool handles(const std::string& name) const { return decoders_.count(name) != 0; }

    // Reads an (itemsPtr, count) pair at the cursor and decodes every item.
    // The cursor ends up right after the pair. Unknown names yield an empty
    // record.
    ExtensionMap read_block(DecodeContext& ctx) const;

    // KHR_materials_unlit
    static const ExtensionRegistry& material();

    // KHR_texture_transform
    static const ExtensionRegistry& texture_info();

private:
    std::unordered_map<std::string, Decoder> decoders_;
};

} // namespace scriptscene::marshal
