#include "cbor_decode/bit_io.hpp"

#include "cbor_decode/format.hpp"

#include <algorithm>
#include <stdexcept>

namespace cbd {

bit_buffer::bit_buffer(byte_vector buffer)
    : _bit_length(buffer.size() * 8) {
    _storage = std::make_shared<const byte_vector>(std::move(buffer));
}

bit_buffer::bit_buffer(byte_vector buffer, size_t bit_length)
    : _bit_length(bit_length) {
    if (bit_length > buffer.size() * 8) {
        throw std::out_of_range(fmt::format(
            "Bit length {} exceeds the {} bits available", bit_length, buffer.size() * 8
        ));
    }

    _storage = std::make_shared<const byte_vector>(std::move(buffer));
}

bool bit_buffer::bit(size_t index) const {
    if (index >= _bit_length) {
        throw std::out_of_range(fmt::format("Bit index {} out of range for {} bits", index, _bit_length));
    }

    return _storage_bit(_bit_offset + index) != 0;
}

bit_buffer bit_buffer::drop_bits(size_t num_bits) const {
    if (num_bits > _bit_length) {
        throw std::out_of_range(fmt::format("Cannot drop {} bits from {} bits", num_bits, _bit_length));
    }

    bit_buffer result{*this};
    result._bit_offset += num_bits;
    result._bit_length -= num_bits;
    return result;
}

byte_vector bit_buffer::vector() const {
    if (is_byte_aligned()) {
        auto first = _storage->cbegin() + _bit_offset / 8;
        byte_vector result(first, first + (_bit_length + 7) / 8);

        if (_bit_length % 8 != 0) {
            result.back() &= static_cast<uint8_t>(0xff << (8 - _bit_length % 8));
        }

        return result;
    }

    byte_vector result((_bit_length + 7) / 8, 0);
    for (size_t i = 0; i < _bit_length; i++) {
        result[i / 8] |= static_cast<uint8_t>(_storage_bit(_bit_offset + i) << (7 - i % 8));
    }

    return result;
}

bool bit_buffer::operator==(const bit_buffer& rhs) const {
    return _bit_length == rhs._bit_length && vector() == rhs.vector();
}

std::string bit_buffer::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void bit_buffer::dump_debug(std::stringstream& ss) const {
    ss << "h'";

    for (uint8_t byte : vector()) {
        ss << fmt::format("{:02x}", byte);
    }

    ss << '\'';

    if (_bit_length % 8 != 0) {
        ss << fmt::format(" ({} bits)", _bit_length);
    }
}

std::ostream& operator<<(std::ostream& os, const bit_buffer& buffer) {
    return os << buffer.dump_debug();
}

std::optional<uint64_t> bit_reader::read_bits(size_t num_bits) {
    if (num_bits > 64) {
        throw std::invalid_argument(fmt::format("Cannot read {} bits into a 64-bit integer", num_bits));
    }

    if (num_bits > bits_remaining()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    size_t pos = _absolute_pos();

    // Whole bytes can be taken directly once the cursor is aligned
    while (num_bits > 0) {
        if (pos % 8 == 0 && num_bits >= 8) {
            value = (value << 8) | (*_buffer._storage)[pos / 8];
            pos += 8;
            num_bits -= 8;
        } else {
            value = (value << 1) | _buffer._storage_bit(pos);
            pos++;
            num_bits--;
        }
    }

    _pos = pos - _buffer._bit_offset;
    return value;
}

std::optional<byte_string> bit_reader::read_bytes(uint64_t num_bytes) {
    if (num_bytes > bits_remaining() / 8) {
        return std::nullopt;
    }

    byte_string result;
    result.resize(num_bytes);

    if (_absolute_pos() % 8 == 0) {
        auto first = _buffer._storage->cbegin() + _absolute_pos() / 8;
        std::copy(first, first + num_bytes, result.begin());
        _pos += num_bytes * 8;
    } else {
        for (auto& byte : result) {
            byte = static_cast<uint8_t>(*read_bits(8));
        }
    }

    return result;
}

}  // namespace cbd
