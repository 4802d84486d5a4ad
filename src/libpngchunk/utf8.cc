//
// Strict UTF-8 validation
//

#include "utf8.hh"

#include <cstdint>

namespace pngchunk {

    namespace {
        bool is_continuation(std::uint8_t c) {
            return (c & 0xC0) == 0x80;
        }
    }

    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) noexcept {
        auto at = [data](std::size_t i) { return std::to_integer<std::uint8_t>(data[i]); };
        std::size_t i = 0;

        while (i < size) {
            const std::uint8_t lead = at(i);

            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            std::uint32_t cp;
            std::uint32_t min_cp;

            if ((lead & 0xE0) == 0xC0) {
                len = 2;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                // Stray continuation byte or 5/6 byte lead
                return i;
            }

            if (size - i < len) {
                return i;
            }

            for (std::size_t k = 1; k < len; k++) {
                const std::uint8_t c = at(i + k);
                if (!is_continuation(c)) {
                    return i;
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return i;
            }

            i += len;
        }

        return std::string::npos;
    }

} // namespace pngchunk
