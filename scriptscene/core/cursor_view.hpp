#pragma once

#include "abi_error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace scriptscene {

// Size of the placeholder that closes every parameter block.
static constexpr std::uint32_t kExtrasByteLength = 8;

bool is_valid_utf8(std::span<const std::uint8_t> bytes);

// ============================================================================
// CursorView - movable read/write cursor over a guest byte buffer
// ============================================================================
//
// Every access is checked against the buffer length before it happens; a
// failed check throws AbiError(DecodeError) and leaves the buffer untouched.
// All multi-byte values are little-endian.

class CursorView {
public:
    explicit CursorView(std::span<std::uint8_t> data, std::uint32_t maxStringBytes = 64 * 1024)
        : data_(data), pos_(0), maxStringBytes_(maxStringBytes) {}

    // --- Positioning ---

    void move_to(std::uint32_t offset) {
        if (offset > data_.size()) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "cursor offset " + std::to_string(offset) + " outside buffer of " +
                           std::to_string(data_.size()) + " bytes");
        }
        pos_ = offset;
    }

    // Same as move_to, but offset 0 (the guest's null pointer) is rejected.
    void move_to_block(std::uint32_t offset) {
        if (offset == 0) {
            throw AbiError(AbiErrorKind::DecodeError, "null parameter block pointer");
        }
        move_to(offset);
    }

    void skip(std::uint32_t bytes) {
        check_remaining(bytes);
        pos_ += bytes;
    }

    void skip_u32() { skip(4); }
    void skip_extras() { skip(kExtrasByteLength); }

    // --- Reads ---

    std::uint32_t read_u32() {
        check_remaining(4);
        std::uint32_t v = static_cast<std::uint32_t>(data_[pos_])
                       | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8)
                       | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16)
                       | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    std::int32_t read_i32() {
        return static_cast<std::int32_t>(read_u32());
    }

    float read_f32() {
        std::uint32_t bits = read_u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    bool read_bool() {
        return read_u32() != 0;
    }

    void read_f32_array(std::span<float> out) {
        check_remaining(static_cast<std::uint64_t>(out.size()) * 4);
        for (auto& v : out) {
            v = read_f32();
        }
    }

    void read_u32_array(std::span<std::uint32_t> out) {
        check_remaining(static_cast<std::uint64_t>(out.size()) * 4);
        for (auto& v : out) {
            v = read_u32();
        }
    }

    template <std::size_t N>
    std::array<float, N> read_f32s() {
        std::array<float, N> out{};
        read_f32_array(out);
        return out;
    }

    template <std::size_t N>
    std::array<std::uint32_t, N> read_u32s() {
        std::array<std::uint32_t, N> out{};
        read_u32_array(out);
        return out;
    }

    // --- Writes ---

    void write_u32(std::uint32_t v) {
        check_remaining(4);
        data_[pos_] = static_cast<std::uint8_t>(v & 0xFF);
        data_[pos_ + 1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
        data_[pos_ + 2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
        data_[pos_ + 3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
        pos_ += 4;
    }

    void write_i32(std::int32_t v) {
        write_u32(static_cast<std::uint32_t>(v));
    }

    void write_f32(float v) {
        std::uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u32(bits);
    }

    void write_f32_array(std::span<const float> values) {
        check_remaining(static_cast<std::uint64_t>(values.size()) * 4);
        for (float v : values) {
            write_f32(v);
        }
    }

    void write_u32_array(std::span<const std::uint32_t> values) {
        check_remaining(static_cast<std::uint64_t>(values.size()) * 4);
        for (std::uint32_t v : values) {
            write_u32(v);
        }
    }

    // --- Out-of-line data (does not move the cursor) ---

    std::span<const std::uint8_t> bytes_at(std::uint32_t ptr, std::uint32_t byteLength) const {
        check_range(ptr, byteLength);
        return std::span<const std::uint8_t>(data_.data() + ptr, byteLength);
    }

    std::span<std::uint8_t> mutable_bytes_at(std::uint32_t ptr, std::uint32_t byteLength) {
        check_range(ptr, byteLength);
        return data_.subspan(ptr, byteLength);
    }

    // UTF-8 string stored at (ptr, byteLength).
    std::string string_at(std::uint32_t ptr, std::uint32_t byteLength) const {
        if (byteLength > maxStringBytes_) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "string of " + std::to_string(byteLength) + " bytes exceeds limit");
        }
        if (byteLength == 0) {
            return {};
        }
        auto bytes = bytes_at(ptr, byteLength);
        if (!is_valid_utf8(bytes)) {
            throw AbiError(AbiErrorKind::DecodeError, "string is not valid UTF-8");
        }
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    // Reads a (ptr, byteLength) pair at the cursor and decodes the string it points to.
    std::string read_string_ref() {
        const std::uint32_t ptr = read_u32();
        const std::uint32_t byteLength = read_u32();
        if (ptr == 0) {
            return {};
        }
        return string_at(ptr, byteLength);
    }

    // --- State ---

    std::uint32_t position() const { return pos_; }
    std::size_t size() const { return data_.size(); }
    std::size_t remaining() const { return data_.size() - pos_; }
    std::uint32_t max_string_bytes() const { return maxStringBytes_; }

private:
    void check_remaining(std::uint64_t need) const {
        if (static_cast<std::uint64_t>(pos_) + need > data_.size()) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "read of " + std::to_string(need) + " bytes at offset " +
                           std::to_string(pos_) + " runs past end of buffer");
        }
    }

    void check_range(std::uint32_t ptr, std::uint32_t byteLength) const {
        if (static_cast<std::uint64_t>(ptr) + byteLength > data_.size()) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "range [" + std::to_string(ptr) + ", +" + std::to_string(byteLength) +
                           ") outside buffer");
        }
    }

    std::span<std::uint8_t> data_;
    std::uint32_t pos_;
    std::uint32_t maxStringBytes_;
};

} // namespace scriptscene
