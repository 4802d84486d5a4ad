//
// Chunk construction, parsing and serialization
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include "utf8.hh"

#include <algorithm>
#include <array>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

namespace pngchunk {

    namespace {
        constexpr std::size_t length_offset = 0;
        constexpr std::size_t type_offset = 4;
        constexpr std::size_t data_offset = 8;

        std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
            const std::uint32_t crc = crc32(type.bytes().data(), chunk_type::size);
            return crc32_update(crc, data, size);
        }

        std::string hex32(std::uint32_t v) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << v;
            return oss.str();
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        std::vector<std::byte> text_bytes(std::string_view text) {
            std::vector<std::byte> out(text.size());
            std::transform(text.begin(), text.end(), out.begin(),
                           [](char c) { return static_cast<std::byte>(c); });
            return out;
        }
    }

    std::uint32_t checked_length(std::size_t size) {
        PNGCHUNK_THROW_IF(static_cast<std::uint64_t>(size) > std::numeric_limits<std::uint32_t>::max(),
                          payload_too_large_error, (size),
                          "Payload of ", size, " bytes does not fit the 32-bit length field");
        return static_cast<std::uint32_t>(size);
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length(checked_length(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(compute_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, text_bytes(text)) {
    }

    chunk::chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    parsed_chunk chunk::parse_prefix(const void* data, std::size_t size, const parse_options& options) {
        const auto* bytes = static_cast<const std::byte*>(data);

        // Length, type and CRC must be present even for an empty payload
        PNGCHUNK_THROW_IF(size < overhead, too_short_error, (overhead, size),
                          "Chunk needs at least ", overhead, " bytes, buffer holds ", size);

        const std::uint32_t length = load_be32(bytes + length_offset);
        const chunk_type type = chunk_type::from_bytes(bytes + type_offset);

        if (length > options.max_chunk_size) {
            if (options.strict) {
                PNGCHUNK_THROW(limit_exceeded_error, (length, options.max_chunk_size),
                               "Chunk '", type.to_string(), "' declares ", length,
                               " bytes, which exceeds maximum allowed size of ",
                               options.max_chunk_size, " bytes");
            }
            warn(options, length_offset, "size_limit",
                 build_error_msg("Chunk '", type.to_string(), "' size ", length,
                                 " exceeds maximum ", options.max_chunk_size));
        }

        const std::uint64_t required = std::uint64_t(overhead) + length;
        PNGCHUNK_THROW_IF(required > size, too_short_error, (required, size),
                          "Chunk '", type.to_string(), "' declares ", length,
                          " payload bytes and needs ", required, " bytes, buffer holds ", size);

        const std::byte* payload = bytes + data_offset;
        const std::uint32_t expected = compute_crc(type, payload, length);
        const std::uint32_t found = load_be32(payload + length);

        PNGCHUNK_THROW_IF(found != expected, checksum_mismatch_error, (expected, found),
                          "Chunk '", type.to_string(), "' CRC mismatch: expected ",
                          hex32(expected), ", found ", hex32(found));

        if (!type.is_reserved_bit_valid()) {
            warn(options, type_offset + 2, "reserved_bit",
                 build_error_msg("Chunk '", type.to_string(), "' has the reserved bit set"));
        }

        return {
            .value = chunk(length, type, std::vector<std::byte>(payload, payload + length), found),
            .consumed = static_cast<std::size_t>(required)
        };
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        parsed_chunk result = parse_prefix(data, size, options);

        if (result.consumed < size) {
            const std::size_t trailing = size - result.consumed;
            PNGCHUNK_THROW_UNLESS(options.allow_trailing_data, trailing_data_error, (trailing),
                                  trailing, " bytes follow chunk '", result.value.type().to_string(),
                                  "' at offset ", result.consumed);
            warn(options, result.consumed, "trailing_data",
                 build_error_msg("Ignoring ", trailing, " bytes after chunk '",
                                 result.value.type().to_string(), "'"));
        }

        return std::move(result.value);
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size(), parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        out.reserve(out.size() + encoded_size());

        std::array<std::byte, data_offset> header;
        store_be32(header.data() + length_offset, m_length);
        m_type.to_bytes(header.data() + type_offset);
        out.insert(out.end(), header.begin(), header.end());

        out.insert(out.end(), m_data.begin(), m_data.end());

        std::array<std::byte, 4> trailer;
        store_be32(trailer.data(), m_crc);
        out.insert(out.end(), trailer.begin(), trailer.end());
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        serialize_to(out);
        return out;
    }

    std::string chunk::data_as_string() const {
        const std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        PNGCHUNK_THROW_IF(bad != std::string::npos, invalid_utf8_error, (bad),
                          "Chunk '", m_type.to_string(), "' payload is not valid UTF-8 at offset ", bad);
        std::string text(m_data.size(), '\0');
        std::transform(m_data.begin(), m_data.end(), text.begin(),
                       [](std::byte b) { return std::to_integer<char>(b); });
        return text;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.data_as_string();
    }

    std::string to_string(const chunk& c) {
        return c.data_as_string();
    }

} // namespace pngchunk
