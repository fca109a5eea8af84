#include "utf8.hpp"

namespace pngme {

bool is_valid_utf8(const uint8_t* data, size_t len) noexcept {
    size_t i = 0;
    while (i < len) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            return false; // stray continuation byte or 0xF8..0xFF
        }

        if (len - i - 1 < extra) return false;
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_cp) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        i += extra + 1;
    }
    return true;
}

} // namespace pngme
