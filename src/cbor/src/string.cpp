#include "cbor_decode/cbor/string.hpp"

#include "cbor_decode/cbor/argument.hpp"
#include "cbor_decode/cbor/utf8.hpp"

#include <cbor_decode/util.hpp>

#include <spdlog/spdlog.h>

namespace cbd {

namespace {

template <typename TString>
decode_result<TString> decode_basic_string(const bit_buffer& buffer) {
    constexpr uint8_t expected_type = detail::basic_cbor_string_type_v<typename TString::value_type>;

    bit_reader reader{buffer};

    auto type = detail::read_major_type(reader);
    if (!type) {
        return tl::make_unexpected(type.error());
    }

    if (type.value() != expected_type) {
        spdlog::debug("Expected major type {} but found {}", expected_type, type.value());
        return tl::make_unexpected(cbor_error::invalid_major_arg(type.value()));
    }

    auto size = detail::read_argument(reader);
    if (!size) {
        return tl::make_unexpected(size.error());
    }

    auto payload = reader.read_bytes(size.value());
    if (!payload) {
        spdlog::debug(
            "String declares {} bytes but only {} bits are left",
            size.value(), reader.bits_remaining()
        );
        return tl::make_unexpected(cbor_error::premature_eof());
    }

    spdlog::trace("Read {}-byte string payload", payload->size());
    return decoded<TString>{TString(payload->cbegin(), payload->cend()), reader.remainder()};
}

}  // namespace

decode_result<byte_string> decode_bytes(const bit_buffer& buffer) {
    return decode_basic_string<byte_string>(buffer);
}

decode_result<std::string> decode_string(const bit_buffer& buffer) {
    auto text = decode_basic_string<std::string>(buffer);
    if (text && !is_valid_utf8(text->value)) {
        const std::string& payload = text->value;

        spdlog::debug("Text string payload is not valid UTF-8:");
        log_multiline_binary(reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), "  ");

        return tl::make_unexpected(cbor_error::malformed_utf8());
    }

    return text;
}

}  // namespace cbd
