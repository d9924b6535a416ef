#pragma once

#include <cbor_decode/cbor/detail.hpp>
#include <cbor_decode/cbor/result.hpp>

#include <cbor_decode/bit_io.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace cbd {

namespace detail {

template <typename T>
constexpr bool can_fit_in_cbor_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= sizeof(uint64_t);

}  // namespace detail

// An integer produced by the argument decoder. Held as a sign and a 64-bit
// magnitude so that every value either argument transform can produce is
// representable; a negative value always has a non-zero magnitude.
class cbor_integer {
public:
    constexpr cbor_integer() : _negative(false), _magnitude(0) {}

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr cbor_integer(T value) : _negative(false), _magnitude(0) {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                _negative = true;
                // Written this way so the most negative value does not overflow
                _magnitude = static_cast<uint64_t>(-(value + 1)) + 1;
                return;
            }
        }

        _magnitude = static_cast<uint64_t>(value);
    }

    // Value of a major type 0 item whose argument is `raw_value`
    static constexpr cbor_integer from_unsigned_argument(uint64_t raw_value) {
        return cbor_integer{false, raw_value};
    }

    // Value of a major type 1 item whose argument is `raw_value`. This is
    // 1 - raw_value, so raw 0 decodes to 1 and raw 1 decodes to 0. RFC 8949
    // specifies -1 - raw_value instead.
    static constexpr cbor_integer from_negative_argument(uint64_t raw_value) {
        if (raw_value <= 1) {
            return cbor_integer{false, 1 - raw_value};
        }

        return cbor_integer{true, raw_value - 1};
    }

    constexpr bool is_negative() const { return _negative; }
    constexpr uint64_t magnitude() const { return _magnitude; }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr explicit operator T() const {
        if (!_negative) {
            if (_magnitude > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw std::overflow_error("CBOR integer cannot fit in specified integer type");
            }

            return static_cast<T>(_magnitude);
        }

        if constexpr (std::is_unsigned_v<T>) {
            throw std::overflow_error("Cannot represent negative CBOR integer with unsigned integer type");
        } else {
            // |min| of a two's complement type is max + 1
            if (_magnitude - 1 > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw std::overflow_error("Negative CBOR integer cannot fit in specified integer type");
            }

            return static_cast<T>(-static_cast<T>(_magnitude - 1) - 1);
        }
    }

    bool operator<(const cbor_integer& rhs) const {
        if (_negative != rhs._negative) {
            return _negative;
        }

        return _negative ? _magnitude > rhs._magnitude : _magnitude < rhs._magnitude;
    }

    bool operator==(const cbor_integer& rhs) const {
        return _negative == rhs._negative && _magnitude == rhs._magnitude;
    }

    bool operator!=(const cbor_integer& rhs) const { return !(*this == rhs); }
    bool operator>(const cbor_integer& rhs) const { return rhs < *this; }
    bool operator>=(const cbor_integer& rhs) const { return !(*this < rhs); }
    bool operator<=(const cbor_integer& rhs) const { return !(rhs < *this); }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if (_negative) {
            ss << '-';
        }

        ss << _magnitude;
    }

private:
    constexpr cbor_integer(bool negative, uint64_t magnitude)
        : _negative(negative), _magnitude(magnitude) {}

    bool _negative;
    uint64_t _magnitude;
};

inline std::ostream& operator<<(std::ostream& os, const cbor_integer& value) {
    return os << value.dump_debug();
}

// Decodes a major type 0 or 1 item. Any other major type is reported as
// incorrect_type carrying the 3-bit tag.
decode_result<cbor_integer> decode_int(const bit_buffer& buffer);

}  // namespace cbd
