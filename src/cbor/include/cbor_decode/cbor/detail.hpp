#pragma once

#include <cstddef>
#include <cstdint>

namespace cbd {

constexpr const uint8_t CBOR_NON_NEGATIVE_INTEGER = 0;
constexpr const uint8_t CBOR_NEGATIVE_INTEGER = 1;
constexpr const uint8_t CBOR_BYTE_STRING = 2;
constexpr const uint8_t CBOR_TEXT_STRING = 3;
constexpr const uint8_t CBOR_ARRAY = 4;

constexpr const size_t CBOR_MAJOR_TYPE_BITS = 3;
constexpr const size_t CBOR_ADDITIONAL_INFO_BITS = 5;

// Additional information values 24 through 27 say the argument follows in the
// next 1, 2, 4 or 8 bytes
constexpr const uint8_t CBOR_ADDITIONAL_INFO_ONE_BYTE = 24;
constexpr const uint8_t CBOR_ADDITIONAL_INFO_EIGHT_BYTES = 27;
constexpr const uint8_t CBOR_ADDITIONAL_INFO_INDEFINITE_LENGTH = 31;

}  // namespace cbd
