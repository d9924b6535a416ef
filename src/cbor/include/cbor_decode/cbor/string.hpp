#pragma once

#include <cbor_decode/cbor/detail.hpp>
#include <cbor_decode/cbor/result.hpp>

#include <cbor_decode/bit_io.hpp>
#include <cbor_decode/types.hpp>

#include <cstdint>
#include <string>

namespace cbd {

namespace detail {

template <typename TChar>
struct basic_cbor_string_type;

template <typename TChar>
inline constexpr uint8_t basic_cbor_string_type_v = basic_cbor_string_type<TChar>::value;

template <> struct basic_cbor_string_type<uint8_t> { static constexpr uint8_t value = CBOR_BYTE_STRING; };
template <> struct basic_cbor_string_type<char> { static constexpr uint8_t value = CBOR_TEXT_STRING; };

}  // namespace detail

// Decodes a definite-length byte string (major type 2). The payload bytes
// are copied out verbatim and the remainder starts right after them.
//
// A different major type is reported as invalid_major_arg carrying the 3-bit
// tag, not as incorrect_type.
decode_result<byte_string> decode_bytes(const bit_buffer& buffer);

// Decodes a definite-length text string (major type 3). Behaves like
// decode_bytes, and additionally fails with malformed_utf8 when the payload
// is not valid UTF-8.
decode_result<std::string> decode_string(const bit_buffer& buffer);

}  // namespace cbd
