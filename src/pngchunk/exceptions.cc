//
// Error code names
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    const char* to_string(type_code_errc code) {
        switch (code) {
            case type_code_errc::length:
                return "length";
            case type_code_errc::illegal_character:
                return "illegal_character";
        }
        return "unknown";
    }

    const char* to_string(chunk_errc code) {
        switch (code) {
            case chunk_errc::too_short:
                return "too_short";
            case chunk_errc::invalid_type_code:
                return "invalid_type_code";
            case chunk_errc::crc_mismatch:
                return "crc_mismatch";
            case chunk_errc::truncated_payload:
                return "truncated_payload";
            case chunk_errc::length_overflow:
                return "length_overflow";
        }
        return "unknown";
    }

    const char* to_string(png_errc code) {
        switch (code) {
            case png_errc::signature_mismatch:
                return "signature_mismatch";
            case png_errc::invalid_chunk:
                return "invalid_chunk";
            case png_errc::chunk_not_found:
                return "chunk_not_found";
        }
        return "unknown";
    }

} // namespace pngchunk
