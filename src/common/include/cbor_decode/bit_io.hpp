#pragma once

#include <cbor_decode/types.hpp>
#include <cbor_decode/util.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace cbd {

// An immutable, length-known sequence of bits read from the front. The bytes
// are copied once on construction and shared by every buffer derived from
// this one, so a remainder outlives the buffer it was taken from.
class bit_buffer {
public:
    bit_buffer() : bit_buffer(byte_vector{}) {}

    bit_buffer(byte_vector buffer);

    // Only the first `bit_length` bits of `buffer` are visible
    bit_buffer(byte_vector buffer, size_t bit_length);

    template <size_t N>
    bit_buffer(const byte_array<N>& buffer)
        : bit_buffer(byte_vector(buffer.cbegin(), buffer.cend())) {}

    bit_buffer(const std::string& str)
        : bit_buffer(byte_vector(str.cbegin(), str.cend())) {}

    bit_buffer(std::string_view str)
        : bit_buffer(byte_vector(str.cbegin(), str.cend())) {}

    bit_buffer(const byte_string& str)
        : bit_buffer(byte_vector(str.cbegin(), str.cend())) {}

    bit_buffer(const byte_string_view& str)
        : bit_buffer(byte_vector(str.cbegin(), str.cend())) {}

    bit_buffer(const uint8_t* buffer, size_t length)
        : bit_buffer(byte_vector(buffer, buffer + length)) {}

    COPYABLE(bit_buffer);
    MOVABLE(bit_buffer);

    size_t size_bits() const { return _bit_length; }
    bool empty() const { return _bit_length == 0; }
    bool is_byte_aligned() const { return _bit_offset % 8 == 0; }

    // Value of the bit at `index` counted from the front, most significant
    // bit of each byte first. Throws std::out_of_range past the end.
    bool bit(size_t index) const;

    // The buffer with its first `num_bits` bits removed
    bit_buffer drop_bits(size_t num_bits) const;

    // The visible bits packed into bytes; a trailing partial byte is padded
    // with zero bits on the right
    byte_vector vector() const;

    bool operator==(const bit_buffer& rhs) const;
    bool operator!=(const bit_buffer& rhs) const { return !(*this == rhs); }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    friend class bit_reader;

    std::shared_ptr<const byte_vector> _storage;
    size_t _bit_offset{0};
    size_t _bit_length{0};

    uint8_t _storage_bit(size_t absolute_index) const {
        return ((*_storage)[absolute_index / 8] >> (7 - absolute_index % 8)) & 1;
    }
};

std::ostream& operator<<(std::ostream& os, const bit_buffer& buffer);

// Cursor over a bit_buffer. Reads never go past the end of the buffer: a read
// that cannot be satisfied returns std::nullopt and consumes nothing.
class bit_reader {
public:
    explicit bit_reader(bit_buffer buffer) : _buffer(std::move(buffer)) {}

    NON_COPYABLE(bit_reader);
    MOVABLE(bit_reader);

    size_t index() const { return _pos; }
    size_t bits_remaining() const { return _buffer.size_bits() - _pos; }

    // Reads `num_bits` (at most 64) as a big-endian unsigned integer
    std::optional<uint64_t> read_bits(size_t num_bits);

    std::optional<uint8_t> read_uint8_t() { return _read_be_primitive<uint8_t>(); }
    std::optional<uint16_t> read_be_uint16_t() { return _read_be_primitive<uint16_t>(); }
    std::optional<uint32_t> read_be_uint32_t() { return _read_be_primitive<uint32_t>(); }
    std::optional<uint64_t> read_be_uint64_t() { return _read_be_primitive<uint64_t>(); }

    // Reads `num_bytes` whole bytes, which need not be byte aligned in the
    // underlying storage
    std::optional<byte_string> read_bytes(uint64_t num_bytes);

    // Everything that has not been read yet
    bit_buffer remainder() const { return _buffer.drop_bits(_pos); }

private:
    bit_buffer _buffer;
    size_t _pos{0};

    size_t _absolute_pos() const { return _buffer._bit_offset + _pos; }

    template <typename T>
    std::optional<T> _read_be_primitive() {
        auto value = read_bits(sizeof(T) * 8);
        if (!value) {
            return std::nullopt;
        }

        return static_cast<T>(*value);
    }
};

}  // namespace cbd
