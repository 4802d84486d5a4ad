//
// UTF-8 validation for textual payloads
//

#pragma once

#include <cstddef>
#include <string>

namespace pngchunk {

    // Offset of the first byte of the first malformed sequence,
    // or std::string::npos if the range is valid UTF-8.
    // Overlong forms, surrogates and code points above U+10FFFF are malformed.
    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) noexcept;

} // namespace pngchunk
