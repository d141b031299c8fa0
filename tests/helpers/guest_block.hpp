#pragma once

/**
 * @file guest_block.hpp
 * @brief Builds guest parameter blocks inside a GuestMemory heap.
 */

#include "scriptscene/core/cursor_view.hpp"
#include "scriptscene/core/guest_memory.hpp"

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace test_helpers {

/** @brief Copies raw bytes into a fresh heap allocation and returns its offset. */
inline std::uint32_t put_bytes(scriptscene::GuestMemory& mem, std::span<const std::uint8_t> bytes,
                               std::uint32_t align = 4) {
    const std::uint32_t ptr = mem.alloc(bytes.empty() ? 1u : static_cast<std::uint32_t>(bytes.size()), align);
    if (ptr == 0) {
        throw std::runtime_error("guest heap exhausted");
    }
    if (!bytes.empty()) {
        std::memcpy(mem.bytes().data() + ptr, bytes.data(), bytes.size());
    }
    return ptr;
}

inline std::uint32_t put_string(scriptscene::GuestMemory& mem, std::string_view s) {
    return put_bytes(mem, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()), 1);
}

inline std::uint32_t put_u32s(scriptscene::GuestMemory& mem, std::initializer_list<std::uint32_t> values) {
    const std::vector<std::uint32_t> v(values);
    return put_bytes(mem, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(v.data()),
                                                        v.size() * sizeof(std::uint32_t)));
}

inline std::uint32_t put_floats(scriptscene::GuestMemory& mem, std::span<const float> values) {
    return put_bytes(mem, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(values.data()),
                                                        values.size() * sizeof(float)));
}

inline std::vector<float> read_floats(scriptscene::GuestMemory& mem, std::uint32_t ptr, std::size_t count) {
    std::vector<float> out(count);
    std::memcpy(out.data(), mem.bytes().data() + ptr, count * sizeof(float));
    return out;
}

inline std::uint32_t read_u32(scriptscene::GuestMemory& mem, std::uint32_t ptr) {
    std::uint32_t v = 0;
    std::memcpy(&v, mem.bytes().data() + ptr, sizeof(v));
    return v;
}

// =============================================================================
// BlockBuilder
// =============================================================================

/**
 * @brief Accumulates a little-endian parameter block, then copies it into the heap.
 *
 * string() allocates the string's bytes right away and appends the
 * (ptr, byteLength) pair to the block.
 */
class BlockBuilder {
public:
    explicit BlockBuilder(scriptscene::GuestMemory& mem) : mem_(mem) {}

    BlockBuilder& u32(std::uint32_t v) {
        append(&v, sizeof(v));
        return *this;
    }

    BlockBuilder& flag(bool v) { return u32(v ? 1u : 0u); }

    BlockBuilder& f32(float v) {
        append(&v, sizeof(v));
        return *this;
    }

    BlockBuilder& f32s(std::initializer_list<float> values) {
        for (float v : values) f32(v);
        return *this;
    }

    BlockBuilder& string(std::string_view s) {
        if (s.empty()) {
            return u32(0).u32(0);
        }
        const std::uint32_t ptr = put_string(mem_, s);
        return u32(ptr).u32(static_cast<std::uint32_t>(s.size()));
    }

    // (ptr, count) pair
    BlockBuilder& array_ref(std::uint32_t ptr, std::uint32_t count) { return u32(ptr).u32(count); }

    // Empty extension list + empty extras
    BlockBuilder& no_extensions() { return u32(0).u32(0); }
    BlockBuilder& no_extras() { return u32(0).u32(0); }

    BlockBuilder& zeros(std::uint32_t byteCount) {
        bytes_.insert(bytes_.end(), byteCount, 0);
        return *this;
    }

    std::size_t size() const { return bytes_.size(); }

    /** @brief Copies the block into the heap and returns its offset. */
    std::uint32_t commit() {
        return put_bytes(mem_, bytes_);
    }

private:
    void append(const void* p, std::size_t n) {
        const auto* b = static_cast<const std::uint8_t*>(p);
        bytes_.insert(bytes_.end(), b, b + n);
    }

    scriptscene::GuestMemory& mem_;
    std::vector<std::uint8_t> bytes_;
};

} // namespace test_helpers
