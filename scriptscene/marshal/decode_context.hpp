#pragma once

#include "../core/config.hpp"
#include "../core/cursor_view.hpp"
#include "../resource/capability_set.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace scriptscene::marshal {

// Everything a decoder needs: the cursor over guest memory, the registry, the
// caller's grants and the configured caps.
struct DecodeContext {
    CursorView& cursor;
    resource::ResourceRegistry& registry;
    const resource::CapabilitySet& caps;
    const core::MemorySettings& limits;

    // Handle field: 0 = absent, otherwise it must resolve to a granted T.
    template <typename T>
    ResourceId read_optional_handle() {
        const ResourceId id = cursor.read_u32();
        if (id != kNullResource) {
            caps.require<T>(registry, id);
        }
        return id;
    }

    // Handle field that may not be 0.
    template <typename T>
    ResourceId read_required_handle() {
        const ResourceId id = cursor.read_u32();
        caps.require<T>(registry, id);
        return id;
    }

    // (ptr, count) pair, count checked against max_array_items.
    std::pair<std::uint32_t, std::uint32_t> read_array_ref(const char* what) {
        const std::uint32_t ptr = cursor.read_u32();
        const std::uint32_t count = cursor.read_u32();
        if (count > limits.max_array_items) {
            throw AbiError(AbiErrorKind::DecodeError,
                           std::string(what) + " count " + std::to_string(count) + " exceeds limit");
        }
        if (count > 0 && ptr == 0) {
            throw AbiError(AbiErrorKind::DecodeError, std::string(what) + " has items but a null pointer");
        }
        return {ptr, count};
    }

    // Offset of item `index` in an array at `ptr`, rejecting 32-bit overflow.
    static std::uint32_t item_offset(std::uint32_t ptr, std::uint32_t index, std::uint32_t stride) {
        const std::uint64_t offset = static_cast<std::uint64_t>(ptr) +
                                     static_cast<std::uint64_t>(index) * stride;
        if (offset > 0xFFFFFFFFull) {
            throw AbiError(AbiErrorKind::DecodeError, "array item offset overflows");
        }
        return static_cast<std::uint32_t>(offset);
    }
};

// Unknown enumerated value -> AbiError(InvalidEnum).
template <typename E>
E require_enum(std::optional<E> value, std::uint32_t raw, const char* field) {
    if (!value) {
        throw AbiError(AbiErrorKind::InvalidEnum,
                       std::string("invalid ") + field + ": " + std::to_string(raw));
    }
    return *value;
}

} // namespace scriptscene::marshal
