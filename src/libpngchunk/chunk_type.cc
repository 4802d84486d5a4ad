//
// Chunk type validation
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_type chunk_type::from_bytes(const bytes_type& raw) {
        for (std::size_t i = 0; i < size; i++) {
            const std::uint8_t b = raw[i];
            PNGCHUNK_THROW_UNLESS(is_letter(b), invalid_tag_byte_error, (b, i),
                                  "Invalid chunk type byte ", static_cast<unsigned>(b),
                                  " at position ", i, ": expected an ASCII letter");
        }
        return chunk_type(raw);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type raw;
        std::memcpy(raw.data(), data, size);
        return from_bytes(raw);
    }

    chunk_type chunk_type::from_string(std::string_view str) {
        PNGCHUNK_THROW_IF(str.size() != size, wrong_tag_length_error, (str.size()),
                          "Chunk type '", str, "' has ", str.size(),
                          " characters, expected ", size);
        return from_bytes(str.data());
    }

} // namespace pngchunk
