#pragma once

#include <cbor_decode/cbor/argument.hpp>
#include <cbor_decode/cbor/detail.hpp>
#include <cbor_decode/cbor/result.hpp>

#include <cbor_decode/bit_io.hpp>
#include <cbor_decode/util.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace cbd {

// The elements of a CBOR array, decoded one at a time as they are pulled.
//
// Each pull hands the residual buffer to the element decoder. A successful
// element advances the residual buffer to that element's remainder; a failed
// one is yielded as the last item and the list stops there, regardless of how
// many elements were declared.
template <typename T>
class cbor_list {
public:
    using element_decoder_type = std::function<decode_result<T>(const bit_buffer&)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = decode_result<T>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() {}

        explicit iterator(cbor_list* list) : _list(list) {
            _advance();
        }

        reference operator*() const { return *_current; }
        pointer operator->() const { return &*_current; }

        iterator& operator++() {
            _advance();
            return *this;
        }

        void operator++(int) { _advance(); }

        bool operator==(const iterator& rhs) const { return _at_end() == rhs._at_end(); }
        bool operator!=(const iterator& rhs) const { return !(*this == rhs); }

    private:
        cbor_list* _list{nullptr};
        std::optional<value_type> _current;

        bool _at_end() const { return !_current.has_value(); }

        void _advance() {
            _current = _list != nullptr ? _list->next() : std::nullopt;
        }
    };

    cbor_list(uint64_t count, bit_buffer buffer, element_decoder_type element_decoder)
        : _remaining(count), _residual(std::move(buffer)), _element_decoder(std::move(element_decoder)) {}

    COPYABLE(cbor_list);
    MOVABLE(cbor_list);

    // Decodes the next element, or returns std::nullopt once the declared
    // count is exhausted or an error has been yielded
    std::optional<decode_result<T>> next() {
        if (finished()) {
            return std::nullopt;
        }

        spdlog::trace("Pulling array element ({} left, {} bits left)", _remaining, _residual.size_bits());

        decode_result<T> element = _element_decoder(_residual);
        if (!element) {
            spdlog::debug("Array element failed to decode: {}", element.error());
            _failed = true;
            return element;
        }

        _remaining--;
        _residual = element.value().remainder;
        return element;
    }

    // Elements not pulled yet; an error does not reset this
    uint64_t remaining() const { return _remaining; }

    bool finished() const { return _failed || _remaining == 0; }

    // Iterating pulls through next(), so it consumes the list
    iterator begin() { return iterator{this}; }
    iterator end() { return iterator{}; }

private:
    uint64_t _remaining;
    bit_buffer _residual;
    element_decoder_type _element_decoder;
    bool _failed{false};
};

// Outcome of decode_list. Taking value() from a temporary result moves the
// list out instead of returning a reference into the temporary, so a
// range-for directly over decode_list(...).value() iterates a live list.
template <typename T>
class list_result : public result<cbor_list<T>> {
public:
    using base_type = result<cbor_list<T>>;

    using base_type::base_type;
    using base_type::value;

    cbor_list<T> value() && { return std::move(static_cast<base_type&>(*this)).value(); }
};

// Decodes the header of a definite-length array (major type 4) and returns
// the lazy list of its elements, each decoded by `element_decoder`, which is
// any callable taking a bit_buffer and returning decode_result<T>.
//
// A different major type is reported as invalid_major_arg carrying the 3-bit
// tag. The buffer following the last element is not exposed.
template <typename TElementDecoder,
          typename T = typename detail::decode_result_traits<
              remove_cvref_t<std::invoke_result_t<TElementDecoder&, const bit_buffer&>>
          >::value_type>
list_result<T> decode_list(const bit_buffer& buffer, TElementDecoder&& element_decoder) {
    bit_reader reader{buffer};

    auto type = detail::read_major_type(reader);
    if (!type) {
        return tl::make_unexpected(type.error());
    }

    if (type.value() != CBOR_ARRAY) {
        spdlog::debug("Expected an array but found major type {}", type.value());
        return tl::make_unexpected(cbor_error::invalid_major_arg(type.value()));
    }

    auto count = detail::read_argument(reader);
    if (!count) {
        return tl::make_unexpected(count.error());
    }

    spdlog::trace("Array declares {} elements", count.value());
    return cbor_list<T>{
        count.value(),
        reader.remainder(),
        typename cbor_list<T>::element_decoder_type{std::forward<TElementDecoder>(element_decoder)},
    };
}

}  // namespace cbd
