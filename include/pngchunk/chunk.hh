/**
 * @file chunk.hh
 * @brief Length-prefixed, type-tagged, CRC-protected chunk
 *
 * Wire layout, big-endian throughout:
 *
 * | offset | size | field                                   |
 * |--------|------|-----------------------------------------|
 * | 0      | 4    | payload length L                        |
 * | 4      | 4    | chunk type (4 ASCII letters)            |
 * | 8      | L    | payload                                 |
 * | 8+L    | 4    | CRC-32 over the type and payload bytes  |
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    struct parsed_chunk;

    /**
     * @class chunk
     * @brief Immutable chunk value
     *
     * A chunk always satisfies crc() == crc32(type bytes ++ payload). It is
     * either built from a type and payload, which computes the CRC, or
     * parsed from bytes, which verifies it.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Length, type and CRC fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type
         * @param data Payload bytes
         * @throws payload_too_large_error if data does not fit a 32-bit length
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk whose payload is the bytes of a string
         */
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief Parse a complete chunk from a buffer
         * @param data Pointer to the buffer
         * @param size Buffer size in bytes
         * @return The parsed chunk
         * @throws too_short_error if the buffer ends before the CRC
         * @throws invalid_tag_byte_error if the type is not 4 ASCII letters
         * @throws checksum_mismatch_error if the stored CRC is wrong
         * @throws trailing_data_error if bytes follow the CRC
         */
        static chunk parse(const void* data, std::size_t size);

        /**
         * @brief Parse a complete chunk with custom options
         *
         * In addition to the errors above, may throw limit_exceeded_error
         * (strict mode). Trailing bytes are only accepted with
         * allow_trailing_data.
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);

        static chunk parse(const std::vector<std::byte>& data);
        static chunk parse(const std::vector<std::byte>& data, const parse_options& options);

        /**
         * @brief Parse the chunk at the start of a buffer
         * @return The chunk and the number of bytes it occupies
         *
         * Bytes after the chunk are left for the caller; this is the entry
         * point for walking consecutive chunks.
         */
        static parsed_chunk parse_prefix(const void* data, std::size_t size, const parse_options& options);

        /**
         * @brief Encode the chunk in wire layout
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Append the wire layout to an existing buffer
         */
        void serialize_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }

        // Number of bytes serialize() produces
        [[nodiscard]] std::size_t encoded_size() const noexcept { return overhead + m_data.size(); }

        /**
         * @brief Payload interpreted as UTF-8 text
         * @throws invalid_utf8_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @struct parsed_chunk
     * @brief Result of chunk::parse_prefix
     */
    struct parsed_chunk {
        chunk value;
        std::size_t consumed;   ///< Bytes taken from the buffer (encoded_size())
    };

    /**
     * @brief Value of the length field for a payload of the given size
     * @throws payload_too_large_error if size does not fit in 32 bits
     */
    PNGCHUNK_EXPORT std::uint32_t checked_length(std::size_t size);

    /**
     * @brief Write the payload as UTF-8 text
     * @throws invalid_utf8_error if the payload is not valid UTF-8; nothing is written
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    /**
     * @brief Payload as UTF-8 text, same as c.data_as_string()
     */
    PNGCHUNK_EXPORT std::string to_string(const chunk& c);

} // namespace pngchunk
