#include "cbor_decode/cbor/integer.hpp"

#include "cbor_decode/cbor/argument.hpp"

#include <spdlog/spdlog.h>

namespace cbd {

decode_result<cbor_integer> decode_int(const bit_buffer& buffer) {
    bit_reader reader{buffer};

    auto type = detail::read_major_type(reader);
    if (!type) {
        return tl::make_unexpected(type.error());
    }

    switch (type.value()) {
        case CBOR_NON_NEGATIVE_INTEGER:
            return decode_positive_int(reader.remainder());
        case CBOR_NEGATIVE_INTEGER:
            return decode_negative_int(reader.remainder());
    }

    spdlog::debug("Expected an integer but found major type {}", type.value());
    return tl::make_unexpected(cbor_error::incorrect_type(type.value()));
}

}  // namespace cbd
