#pragma once

#include "cursor_view.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace scriptscene {

// ============================================================================
// GuestMemory - linear heap owned by one script environment
// ============================================================================
//
// Offsets handed to the guest are byte offsets into this heap. The first
// kReservedBytes are never allocated so that offset 0 can mean "null".

class GuestMemory {
public:
    static constexpr std::uint32_t kReservedBytes = 8;

    GuestMemory(std::uint32_t initialBytes, std::uint32_t limitBytes);

    // Bump allocation; grows the heap up to the limit. Returns 0 when the
    // request cannot be satisfied.
    std::uint32_t alloc(std::uint32_t size, std::uint32_t align = 8);

    // Drops every allocation and zeroes the heap.
    void reset();

    std::span<std::uint8_t> bytes() { return data_; }
    std::span<const std::uint8_t> bytes() const { return data_; }

    std::uint32_t size() const { return static_cast<std::uint32_t>(data_.size()); }
    std::uint32_t used() const { return top_; }
    std::uint32_t limit() const { return limit_; }

    CursorView cursor(std::uint32_t maxStringBytes) {
        return CursorView(data_, maxStringBytes);
    }

private:
    bool grow_to(std::uint64_t needed);

    std::vector<std::uint8_t> data_;
    std::uint32_t top_{kReservedBytes};
    std::uint32_t limit_;
};

} // namespace scriptscene
