#include <cbor_decode/bit_io.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

TEST(BitIO, ReadBits) {
    {
        std::vector<uint8_t> bytes = {0b101'11001, 0x01, 0xf4};
        cbd::bit_reader reader{bytes};

        ASSERT_EQ(reader.read_bits(3), 0b101u);
        ASSERT_EQ(reader.read_bits(5), 0b11001u);
        ASSERT_EQ(reader.read_be_uint16_t(), 500);
        ASSERT_EQ(reader.bits_remaining(), 0);
        ASSERT_EQ(reader.index(), 24);
    }

    // Reads that straddle byte boundaries
    {
        std::vector<uint8_t> bytes = {0b0000'1111, 0b1111'0000};
        cbd::bit_reader reader{bytes};

        ASSERT_EQ(reader.read_bits(4), 0u);
        ASSERT_EQ(reader.read_bits(8), 0xffu);
        ASSERT_EQ(reader.read_bits(4), 0u);
    }

    {
        std::vector<uint8_t> bytes(8, 0xff);
        cbd::bit_reader reader{bytes};
        ASSERT_EQ(reader.read_be_uint64_t(), std::numeric_limits<uint64_t>::max());
    }

    // 32-bit read starting mid-byte
    {
        std::vector<uint8_t> bytes = {0b1111'0001, 0x23, 0x45, 0x67, 0b1000'0000};
        cbd::bit_reader reader{bytes};

        ASSERT_EQ(reader.read_bits(4), 0xfu);
        ASSERT_EQ(reader.read_be_uint32_t(), 0x12345678u);
        ASSERT_EQ(reader.bits_remaining(), 4);
        ASSERT_FALSE(reader.read_be_uint32_t().has_value());
        ASSERT_EQ(reader.bits_remaining(), 4);
    }
}

TEST(BitIO, ReadPastEnd) {
    std::vector<uint8_t> bytes = {0xab, 0xcd};
    cbd::bit_reader reader{bytes};

    ASSERT_EQ(reader.read_uint8_t(), 0xab);
    ASSERT_FALSE(reader.read_be_uint16_t().has_value());

    // A failed read consumes nothing
    ASSERT_EQ(reader.index(), 8);
    ASSERT_EQ(reader.read_uint8_t(), 0xcd);
    ASSERT_FALSE(reader.read_bits(1).has_value());
    ASSERT_FALSE(reader.read_bytes(1).has_value());
    ASSERT_TRUE(reader.read_bytes(0).has_value());

    ASSERT_THROW(reader.read_bits(65), std::invalid_argument);
}

TEST(BitIO, ReadBytes) {
    // Aligned
    {
        std::vector<uint8_t> bytes = {'a', 'b', 'c', 'd'};
        cbd::bit_reader reader{bytes};

        auto actual = reader.read_bytes(3);
        ASSERT_TRUE(actual.has_value());
        ASSERT_EQ(*actual, (cbd::byte_string{'a', 'b', 'c'}));
        ASSERT_EQ(reader.bits_remaining(), 8);
    }

    // Unaligned: 4 bits of padding, then 0x12 0x34, then 4 more bits
    {
        std::vector<uint8_t> bytes = {0xf1, 0x23, 0x4f};
        cbd::bit_reader reader{bytes};

        ASSERT_EQ(reader.read_bits(4), 0xfu);

        auto actual = reader.read_bytes(2);
        ASSERT_TRUE(actual.has_value());
        ASSERT_EQ(*actual, (cbd::byte_string{0x12, 0x34}));
        ASSERT_EQ(reader.bits_remaining(), 4);
    }

    // Lengths that cannot possibly fit are rejected without overflowing
    {
        std::vector<uint8_t> bytes = {0x00};
        cbd::bit_reader reader{bytes};
        ASSERT_FALSE(reader.read_bytes(std::numeric_limits<uint64_t>::max()).has_value());
    }
}

TEST(BitIO, Remainder) {
    std::vector<uint8_t> bytes = {0x01, 0x02, 0x03};

    cbd::bit_buffer remainder;
    {
        cbd::bit_reader reader{bytes};
        reader.read_uint8_t();
        remainder = reader.remainder();
    }

    // The remainder keeps the shared storage alive on its own
    ASSERT_EQ(remainder.size_bits(), 16);
    ASSERT_EQ(remainder, (cbd::bit_buffer{std::vector<uint8_t>{0x02, 0x03}}));
    ASSERT_EQ(remainder.vector(), (std::vector<uint8_t>{0x02, 0x03}));
}

TEST(BitIO, BitBuffer) {
    {
        cbd::bit_buffer buffer{std::vector<uint8_t>{0xff}, 3};
        ASSERT_EQ(buffer.size_bits(), 3);
        ASSERT_EQ(buffer.vector(), (std::vector<uint8_t>{0xe0}));
        ASSERT_EQ(buffer.dump_debug(), "h'e0' (3 bits)");
        ASSERT_TRUE(buffer.bit(2));
        ASSERT_THROW(buffer.bit(3), std::out_of_range);
    }

    {
        cbd::bit_buffer buffer{std::vector<uint8_t>{0x80, 0x01}};
        ASSERT_TRUE(buffer.bit(0));
        ASSERT_FALSE(buffer.bit(1));
        ASSERT_TRUE(buffer.bit(15));
        ASSERT_EQ(buffer.dump_debug(), "h'8001'");

        cbd::bit_buffer dropped = buffer.drop_bits(1);
        ASSERT_FALSE(dropped.is_byte_aligned());
        ASSERT_EQ(dropped.size_bits(), 15);
        ASSERT_EQ(dropped.vector(), (std::vector<uint8_t>{0x00, 0x02}));

        ASSERT_TRUE(buffer.drop_bits(16).empty());
        ASSERT_THROW(buffer.drop_bits(17), std::out_of_range);
    }

    // Equality compares bit contents, not where the bits sit in storage
    {
        cbd::bit_buffer shifted = cbd::bit_buffer{std::vector<uint8_t>{0x0a, 0xb0}, 12}.drop_bits(4);
        cbd::bit_buffer aligned{std::vector<uint8_t>{0xab}};
        ASSERT_EQ(shifted, aligned);
        ASSERT_NE(shifted, cbd::bit_buffer{std::vector<uint8_t>{0xac}});
    }

    ASSERT_THROW((cbd::bit_buffer{std::vector<uint8_t>{0x00}, 9}), std::out_of_range);
}
