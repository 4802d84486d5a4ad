/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchunk library
 *
 * Every failure of the codec is reported as an exception derived from
 * chunk_error. Each concrete class corresponds to exactly one error_kind
 * and carries the values describing the failure, so callers can branch on
 * the kind (or catch the concrete type) instead of parsing messages.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <cstdint>
#include <cstddef>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Closed set of failure kinds raised by the codec
     */
    enum class error_kind {
        invalid_tag_byte,   ///< A type tag byte is not an ASCII letter
        wrong_tag_length,   ///< A string-form type tag is not 4 characters
        too_short,          ///< Buffer lacks bytes for header, payload or CRC
        checksum_mismatch,  ///< Stored CRC disagrees with the computed one
        payload_too_large,  ///< Payload does not fit the 32-bit length field
        invalid_utf8,       ///< Payload is not valid UTF-8 text
        limit_exceeded,     ///< Declared length is above parse_options::max_chunk_size
        trailing_data       ///< Bytes follow the CRC and trailing data is not allowed
    };

    /**
     * @brief Stable, lowercase name of an error kind (e.g. "checksum_mismatch")
     */
    PNGCHUNK_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class chunk_error
     * @brief Base exception class for all pngchunk errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every codec error with a single catch block.
     */
    class PNGCHUNK_EXPORT chunk_error : public std::runtime_error {
    public:
        chunk_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class invalid_tag_byte_error
     * @brief A byte of a type tag is outside A-Z / a-z
     */
    class PNGCHUNK_EXPORT invalid_tag_byte_error : public chunk_error {
    public:
        invalid_tag_byte_error(std::uint8_t byte, std::size_t position, const std::string& msg)
            : chunk_error(error_kind::invalid_tag_byte, msg), m_byte(byte), m_position(position) {}

        [[nodiscard]] std::uint8_t byte() const noexcept { return m_byte; }
        [[nodiscard]] std::size_t position() const noexcept { return m_position; }

    private:
        std::uint8_t m_byte;
        std::size_t m_position;
    };

    /**
     * @class wrong_tag_length_error
     * @brief A string-form type tag does not have exactly 4 characters
     */
    class PNGCHUNK_EXPORT wrong_tag_length_error : public chunk_error {
    public:
        wrong_tag_length_error(std::size_t actual, const std::string& msg)
            : chunk_error(error_kind::wrong_tag_length, msg), m_actual(actual) {}

        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        std::size_t m_actual;
    };

    /**
     * @class too_short_error
     * @brief The input buffer ends before the record does
     */
    class PNGCHUNK_EXPORT too_short_error : public chunk_error {
    public:
        too_short_error(std::uint64_t required, std::uint64_t available, const std::string& msg)
            : chunk_error(error_kind::too_short, msg), m_required(required), m_available(available) {}

        /// Number of bytes the record needs
        [[nodiscard]] std::uint64_t required() const noexcept { return m_required; }
        /// Number of bytes the buffer holds
        [[nodiscard]] std::uint64_t available() const noexcept { return m_available; }

    private:
        std::uint64_t m_required;
        std::uint64_t m_available;
    };

    /**
     * @class checksum_mismatch_error
     * @brief The trailing CRC does not match the tag and payload
     *
     * Indicates corruption or tampering. The record is rejected as a whole.
     */
    class PNGCHUNK_EXPORT checksum_mismatch_error : public chunk_error {
    public:
        checksum_mismatch_error(std::uint32_t expected, std::uint32_t found, const std::string& msg)
            : chunk_error(error_kind::checksum_mismatch, msg), m_expected(expected), m_found(found) {}

        /// CRC computed over the tag and payload
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC stored in the record
        [[nodiscard]] std::uint32_t found() const noexcept { return m_found; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_found;
    };

    class PNGCHUNK_EXPORT payload_too_large_error : public chunk_error {
    public:
        payload_too_large_error(std::uint64_t size, const std::string& msg)
            : chunk_error(error_kind::payload_too_large, msg), m_size(size) {}

        [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }

    private:
        std::uint64_t m_size;
    };

    class PNGCHUNK_EXPORT invalid_utf8_error : public chunk_error {
    public:
        invalid_utf8_error(std::size_t offset, const std::string& msg)
            : chunk_error(error_kind::invalid_utf8, msg), m_offset(offset) {}

        /// Payload offset of the first byte of the offending sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    class PNGCHUNK_EXPORT limit_exceeded_error : public chunk_error {
    public:
        limit_exceeded_error(std::uint64_t length, std::uint64_t limit, const std::string& msg)
            : chunk_error(error_kind::limit_exceeded, msg), m_length(length), m_limit(limit) {}

        [[nodiscard]] std::uint64_t length() const noexcept { return m_length; }
        [[nodiscard]] std::uint64_t limit() const noexcept { return m_limit; }

    private:
        std::uint64_t m_length;
        std::uint64_t m_limit;
    };

    class PNGCHUNK_EXPORT trailing_data_error : public chunk_error {
    public:
        trailing_data_error(std::uint64_t trailing, const std::string& msg)
            : chunk_error(error_kind::trailing_data, msg), m_trailing(trailing) {}

        [[nodiscard]] std::uint64_t trailing() const noexcept { return m_trailing; }

    private:
        std::uint64_t m_trailing;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def PNGCHUNK_THROW
     * @brief Throw a concrete chunk_error subclass with a formatted message
     * @param type Exception class (e.g. too_short_error)
     * @param fields Parenthesized constructor fields preceding the message
     * @param ... Variable arguments to format into the error message
     *
     * Example: PNGCHUNK_THROW(too_short_error, (12, size), "need 12 bytes, got ", size);
     */
    #define PNGCHUNK_THROW(type, fields, ...) \
        throw ::pngchunk::type(PNGCHUNK_EXPAND_FIELDS fields ::pngchunk::build_error_msg(__VA_ARGS__))

    #define PNGCHUNK_EXPAND_FIELDS(...) __VA_ARGS__,

    /**
     * @def PNGCHUNK_THROW_IF
     * @brief Conditionally throw a chunk_error subclass
     */
    #define PNGCHUNK_THROW_IF(condition, type, fields, ...) \
        do { if (condition) PNGCHUNK_THROW(type, fields, __VA_ARGS__); } while(0)

    /**
     * @def PNGCHUNK_THROW_UNLESS
     * @brief Throw a chunk_error subclass unless condition is true
     */
    #define PNGCHUNK_THROW_UNLESS(condition, type, fields, ...) \
        do { if (!(condition)) PNGCHUNK_THROW(type, fields, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
