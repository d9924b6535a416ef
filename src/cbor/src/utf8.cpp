#include "cbor_decode/cbor/utf8.hpp"

#include <cstdint>

namespace cbd {

namespace {

bool is_continuation_byte(uint8_t c) {
    return (c & 0b1100'0000) == 0b1000'0000;
}

}  // namespace

bool is_valid_utf8(std::string_view str) {
    size_t i = 0;

    while (i < str.size()) {
        auto lead = static_cast<uint8_t>(str[i]);

        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t sequence_length;
        uint32_t code_point;
        uint32_t min_code_point;

        if ((lead & 0b1110'0000) == 0b1100'0000) {
            sequence_length = 2;
            code_point = lead & 0b0001'1111;
            min_code_point = 0x80;
        } else if ((lead & 0b1111'0000) == 0b1110'0000) {
            sequence_length = 3;
            code_point = lead & 0b0000'1111;
            min_code_point = 0x800;
        } else if ((lead & 0b1111'1000) == 0b1111'0000) {
            sequence_length = 4;
            code_point = lead & 0b0000'0111;
            min_code_point = 0x10000;
        } else {
            // Stray continuation byte, or 0xf8-0xff
            return false;
        }

        if (str.size() - i < sequence_length) {
            return false;
        }

        for (size_t j = 1; j < sequence_length; j++) {
            auto c = static_cast<uint8_t>(str[i + j]);
            if (!is_continuation_byte(c)) {
                return false;
            }

            code_point = (code_point << 6) | (c & 0b0011'1111);
        }

        if (code_point < min_code_point) {
            return false;  // overlong
        }

        if (code_point >= 0xd800 && code_point <= 0xdfff) {
            return false;  // surrogate half
        }

        if (code_point > 0x10ffff) {
            return false;
        }

        i += sequence_length;
    }

    return true;
}

}  // namespace cbd
