/**
 * @file chunk_type.hh
 * @brief Validated 4-byte chunk type code
 *
 * A chunk type consists of four ASCII letters. The case of each letter
 * carries one property bit:
 *
 * | byte | uppercase            | lowercase        |
 * |------|----------------------|------------------|
 * | 0    | critical             | ancillary        |
 * | 1    | public               | private          |
 * | 2    | reserved bit valid   | reserved bit set |
 * | 3    | unsafe to copy       | safe to copy     |
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <ostream>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;

        using bytes_type = std::array<std::uint8_t, size>;

        /**
         * @brief Create a chunk type from its raw bytes
         * @throws invalid_tag_byte_error on the first byte that is not A-Z or a-z
         */
        static chunk_type from_bytes(const bytes_type& raw);

        /**
         * @brief Create a chunk type from 4 bytes of raw memory
         * @param data Pointer to at least 4 readable bytes
         * @throws invalid_tag_byte_error on the first byte that is not A-Z or a-z
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Create a chunk type from its textual form, e.g. "IHDR"
         * @throws wrong_tag_length_error unless the string has exactly 4 characters
         * @throws invalid_tag_byte_error on the first byte that is not A-Z or a-z
         */
        static chunk_type from_string(std::string_view str);

        // Raw bytes, case preserved
        [[nodiscard]] const bytes_type& bytes() const noexcept { return m_bytes; }

        // Write the 4 bytes to dest
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        // The 4 bytes as characters, case preserved
        [[nodiscard]] std::string to_string() const {
            return std::string(m_bytes.begin(), m_bytes.end());
        }

        [[nodiscard]] bool is_critical() const noexcept { return is_upper(m_bytes[0]); }
        [[nodiscard]] bool is_public() const noexcept { return is_upper(m_bytes[1]); }
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return is_upper(m_bytes[2]); }
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return !is_upper(m_bytes[3]); }

        // A type is valid when its reserved bit is not set
        [[nodiscard]] bool is_valid() const noexcept { return is_reserved_bit_valid(); }

        [[nodiscard]] std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] auto end() const { return m_bytes.end(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // ASCII letter test, independent of the current locale
        static constexpr bool is_letter(std::uint8_t c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string();
        }

    private:
        explicit chunk_type(const bytes_type& raw) : m_bytes(raw) {}

        // Only called on validated letters; bit 5 clear means uppercase
        static constexpr bool is_upper(std::uint8_t c) noexcept {
            return (c & 0x20) == 0;
        }

        bytes_type m_bytes;
    };

    // Hash of the big-endian 32-bit type code
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            const std::uint32_t code = (std::uint32_t(t[0]) << 24) | (std::uint32_t(t[1]) << 16) |
                                       (std::uint32_t(t[2]) << 8) | std::uint32_t(t[3]);
            return std::hash<std::uint32_t>{}(code);
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
