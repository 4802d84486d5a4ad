//
// Names of the error kinds
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_tag_byte:
                return "invalid_tag_byte";
            case error_kind::wrong_tag_length:
                return "wrong_tag_length";
            case error_kind::too_short:
                return "too_short";
            case error_kind::checksum_mismatch:
                return "checksum_mismatch";
            case error_kind::payload_too_large:
                return "payload_too_large";
            case error_kind::invalid_utf8:
                return "invalid_utf8";
            case error_kind::limit_exceeded:
                return "limit_exceeded";
            case error_kind::trailing_data:
                return "trailing_data";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngchunk
