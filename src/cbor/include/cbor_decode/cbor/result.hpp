#pragma once

#include <cbor_decode/cbor/error.hpp>

#include <cbor_decode/bit_io.hpp>

#include <tl/expected.hpp>

#include <utility>

namespace cbd {

// A decoded value together with the part of the input it did not consume
template <typename T>
struct decoded {
    T value;
    bit_buffer remainder;
};

// Either a value or the cbor_error explaining why there isn't one. Decoders
// never throw for malformed input; they return one of these instead.
template <typename T>
using result = tl::expected<T, cbor_error>;

template <typename T>
using decode_result = result<decoded<T>>;

// For callers that want exceptions at their own boundary
template <typename T>
T value_or_throw(const result<T>& r) {
    if (!r) {
        throw cbor_decode_exception(r.error());
    }

    return *r;
}

template <typename T>
T value_or_throw(result<T>&& r) {
    if (!r) {
        throw cbor_decode_exception(r.error());
    }

    return *std::move(r);
}

namespace detail {

template <typename TResult>
struct decode_result_traits;

template <typename T>
struct decode_result_traits<result<decoded<T>>> {
    using value_type = T;
};

}  // namespace detail

}  // namespace cbd
