//
// Parsing of user-supplied chunk type codes
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_type chunk_type::parse(std::string_view text) {
        if (text.size() != 4) {
            THROW_TYPE_CODE(type_code_errc::length, text.size(),
                            "Expected 4 bytes but found ", text.size());
        }

        for (std::size_t i = 0; i < text.size(); i++) {
            auto c = static_cast<std::uint8_t>(text[i]);
            if (!is_valid_byte(c)) {
                THROW_TYPE_CODE(type_code_errc::illegal_character, text.size(),
                                "Chunk type '", text, "' contains non alphabetic character at position ", i);
            }
        }

        return from_bytes(text.data());
    }

} // namespace pngchunk
