#include "cursor_view.hpp"

namespace scriptscene {

bool is_valid_utf8(std::span<const std::uint8_t> bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        const std::uint8_t c = bytes[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t minCp = 0;

        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
            minCp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
            minCp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
            minCp = 0x10000;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF are rejected.
        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

} // namespace scriptscene
