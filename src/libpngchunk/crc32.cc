//
// CRC-32 on top of zlib
//

#include <pngchunk/crc32.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        auto* p = static_cast<const Bytef*>(data);
        uLong value = crc;

        // zlib takes uInt lengths; larger ranges are fed in slices
        while (size > 0) {
            const auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, p, n);
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t crc32(const void* data, std::size_t size) {
        return crc32_update(0, data, size);
    }

    std::uint32_t crc32(const std::vector<std::byte>& data) {
        return crc32_update(0, data.data(), data.size());
    }

} // namespace pngchunk
