/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk decoding
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing a chunk
     *
     * Default-constructed options accept every well-formed chunk, whatever
     * its declared length, and require the buffer to end with its CRC.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a declared length above max_chunk_size fails the parse.
         * When false, a "size_limit" warning is reported and parsing continues;
         * the CRC still guards the payload.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed payload length in bytes
         *
         * Default is the full range of the 32-bit length field.
         */
        std::uint32_t max_chunk_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @brief Accept bytes after the CRC
         *
         * When false, the buffer must hold exactly one chunk and any bytes
         * after the CRC fail the parse. When true, they are ignored and
         * reported as a "trailing_data" warning.
         */
        bool allow_trailing_data = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where the condition was found
         * @param category Warning category ("size_limit", "trailing_data", "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
