/**
 * @file crc32.hh
 * @brief CRC-32/ISO-HDLC, the checksum used by PNG, zip and zlib
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Compute the CRC-32 of a byte range
     * @param data Pointer to the bytes, may be null when size is 0
     * @param size Number of bytes
     * @return CRC-32/ISO-HDLC of the range ("123456789" gives 0xCBF43926)
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size);

    PNGCHUNK_EXPORT std::uint32_t crc32(const std::vector<std::byte>& data);

    /**
     * @brief Continue a CRC-32 computation with more bytes
     * @param crc Value returned for the preceding bytes (0 to start)
     * @param data Pointer to the next bytes
     * @param size Number of bytes
     *
     * crc32_update(crc32(a), b) equals crc32(a ++ b).
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

} // namespace pngchunk
