#include "cbor_decode/cbor/argument.hpp"

#include <spdlog/spdlog.h>

namespace cbd {

namespace detail {

result<uint8_t> read_major_type(bit_reader& reader) {
    auto type = reader.read_bits(CBOR_MAJOR_TYPE_BITS);
    if (!type) {
        spdlog::debug("Ran out of input reading major type ({} bits left)", reader.bits_remaining());
        return tl::make_unexpected(cbor_error::premature_eof());
    }

    spdlog::trace("Major type {} at bit {}", *type, reader.index() - CBOR_MAJOR_TYPE_BITS);
    return static_cast<uint8_t>(*type);
}

result<uint64_t> read_argument(bit_reader& reader) {
    auto additional_info = reader.read_bits(CBOR_ADDITIONAL_INFO_BITS);
    if (!additional_info) {
        spdlog::debug("Ran out of input reading additional information ({} bits left)", reader.bits_remaining());
        return tl::make_unexpected(cbor_error::premature_eof());
    }

    auto info = static_cast<uint8_t>(*additional_info);
    if (info < CBOR_ADDITIONAL_INFO_ONE_BYTE) {
        return uint64_t{info};
    }

    if (info > CBOR_ADDITIONAL_INFO_EIGHT_BYTES) {
        if (info == CBOR_ADDITIONAL_INFO_INDEFINITE_LENGTH) {
            spdlog::debug("Indefinite-length items are not supported");
            return tl::make_unexpected(cbor_error::unsupported(info));
        }

        spdlog::debug("Reserved additional information value {}", info);
        return tl::make_unexpected(cbor_error::invalid_major_arg(info));
    }

    size_t num_bytes = size_t{1} << (info - CBOR_ADDITIONAL_INFO_ONE_BYTE);
    auto value = reader.read_bits(num_bytes * 8);
    if (!value) {
        spdlog::debug(
            "Ran out of input reading {}-byte argument ({} bits left)",
            num_bytes, reader.bits_remaining()
        );
        return tl::make_unexpected(cbor_error::premature_eof());
    }

    spdlog::trace("Argument {} from {} extension bytes", *value, num_bytes);
    return *value;
}

}  // namespace detail

decode_result<cbor_integer> decode_positive_int(const bit_buffer& buffer) {
    bit_reader reader{buffer};

    auto raw_value = detail::read_argument(reader);
    if (!raw_value) {
        return tl::make_unexpected(raw_value.error());
    }

    return decoded<cbor_integer>{cbor_integer::from_unsigned_argument(raw_value.value()), reader.remainder()};
}

decode_result<cbor_integer> decode_negative_int(const bit_buffer& buffer) {
    bit_reader reader{buffer};

    auto raw_value = detail::read_argument(reader);
    if (!raw_value) {
        return tl::make_unexpected(raw_value.error());
    }

    return decoded<cbor_integer>{cbor_integer::from_negative_argument(raw_value.value()), reader.remainder()};
}

}  // namespace cbd
