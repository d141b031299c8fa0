#pragma once

// Shared helpers for the handler translation units.

#include "dispatcher.hpp"

#include <array>
#include <span>
#include <string>

namespace scriptscene::abi::detail {

inline constexpr double kOk = 0.0;

inline double as_id(ResourceId id) { return static_cast<double>(id); }
inline double as_flag(bool v) { return v ? 1.0 : 0.0; }

// First resource of type T named `name` in registration order that the
// caller may reference.
template <typename T>
ResourceId find_by_name(CallContext& ctx, std::uint32_t namePtr, std::uint32_t byteLength) {
    const std::string name = ctx.cursor.string_at(namePtr, byteLength);
    for (resource::Resource* r : ctx.registry().find_by_name(resource::ResourceTraits<T>::type, name)) {
        if (ctx.caps().permits(ctx.registry(), r->id)) {
            return r->id;
        }
    }
    return kNullResource;
}

template <std::size_t N>
std::array<float, N> read_floats(CallContext& ctx, std::uint32_t ptr) {
    ctx.cursor.move_to_block(ptr);
    return ctx.cursor.read_f32s<N>();
}

inline void write_floats(CallContext& ctx, std::uint32_t ptr, std::span<const float> values) {
    ctx.cursor.move_to_block(ptr);
    ctx.cursor.write_f32_array(values);
}

// Element index into a fixed-size float array.
inline std::size_t element_index(const AbiArgs& args, std::size_t argIndex, std::size_t extent) {
    const std::uint32_t index = args.u32(argIndex);
    if (index >= extent) {
        throw AbiError(AbiErrorKind::DecodeError,
                       "element index " + std::to_string(index) + " out of range " + std::to_string(extent));
    }
    return index;
}

} // namespace scriptscene::abi::detail
