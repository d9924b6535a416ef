#pragma once

#include <cbor_decode/cbor/integer.hpp>
#include <cbor_decode/cbor/result.hpp>

#include <cbor_decode/bit_io.hpp>

#include <cstdint>

namespace cbd {

// Decodes the 5-bit additional information field at the front of `buffer`
// (plus its 1/2/4/8 byte extension) as a non-negative integer.
//
//   0-23      the field itself, no extension bytes
//   24-27     the next 1, 2, 4 or 8 bytes, big-endian
//   28-30     invalid_major_arg carrying the field
//   31        unsupported (indefinite length)
//
// Running out of bits anywhere is premature_eof.
decode_result<cbor_integer> decode_positive_int(const bit_buffer& buffer);

// Same as decode_positive_int, but the decoded argument n becomes 1 - n.
decode_result<cbor_integer> decode_negative_int(const bit_buffer& buffer);

namespace detail {

result<uint8_t> read_major_type(bit_reader& reader);
result<uint64_t> read_argument(bit_reader& reader);

}  // namespace detail

}  // namespace cbd
