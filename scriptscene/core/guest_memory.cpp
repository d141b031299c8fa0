#include "guest_memory.hpp"

#include <algorithm>

namespace scriptscene {

namespace {

constexpr std::uint64_t kPageBytes = 64 * 1024;

} // namespace

GuestMemory::GuestMemory(std::uint32_t initialBytes, std::uint32_t limitBytes)
    : limit_(std::max(limitBytes, std::max(initialBytes, kReservedBytes)))
{
    data_.resize(std::max(initialBytes, kReservedBytes), 0);
}

bool GuestMemory::grow_to(std::uint64_t needed) {
    if (needed <= data_.size()) return true;
    if (needed > limit_) return false;

    std::uint64_t newSize = std::max<std::uint64_t>(data_.size(), kPageBytes);
    while (newSize < needed) {
        newSize *= 2;
    }
    newSize = std::min<std::uint64_t>(newSize, limit_);

    data_.resize(static_cast<std::size_t>(newSize), 0);
    return true;
}

std::uint32_t GuestMemory::alloc(std::uint32_t size, std::uint32_t align) {
    if (size == 0) return 0;
    if (align == 0 || (align & (align - 1)) != 0) return 0;

    const std::uint64_t start = (static_cast<std::uint64_t>(top_) + (align - 1)) & ~static_cast<std::uint64_t>(align - 1);
    const std::uint64_t end = start + size;

    if (!grow_to(end)) {
        return 0;
    }

    top_ = static_cast<std::uint32_t>(end);
    return static_cast<std::uint32_t>(start);
}

void GuestMemory::reset() {
    std::fill(data_.begin(), data_.end(), std::uint8_t{0});
    top_ = kReservedBytes;
}

} // namespace scriptscene
