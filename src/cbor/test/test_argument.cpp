#include <cbor_decode/bit_io.hpp>
#include <cbor_decode/cbor.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

// The argument decoders start right after the 3-bit major type
cbd::bit_buffer after_major_type(std::vector<uint8_t> bytes) {
    return cbd::bit_buffer{std::move(bytes)}.drop_bits(cbd::CBOR_MAJOR_TYPE_BITS);
}

}  // namespace

TEST(CBOR, PositiveArgument) {
    {
        auto actual = cbd::decode_positive_int(after_major_type({0b000'10111}));
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, 23);
        ASSERT_TRUE(actual.value().remainder.empty());
    }

    {
        auto actual = cbd::decode_positive_int(after_major_type({0b000'11000, 0x64, 0x2a}));
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, 100);
        ASSERT_EQ(actual.value().remainder, (cbd::bit_buffer{std::vector<uint8_t>{0x2a}}));
    }

    // The additional information does not have to be byte aligned at all
    {
        cbd::bit_buffer buffer{std::vector<uint8_t>{0b11000'011, 0b00100'000}, 13};
        auto actual = cbd::decode_positive_int(buffer);
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, 100);
        ASSERT_TRUE(actual.value().remainder.empty());
    }
}

TEST(CBOR, NegativeArgument) {
    // The argument n decodes to 1 - n
    {
        auto actual = cbd::decode_negative_int(after_major_type({0b001'00000}));
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, 1);
    }

    {
        auto actual = cbd::decode_negative_int(after_major_type({0b001'00001}));
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, 0);
        ASSERT_FALSE(actual.value().value.is_negative());
    }

    {
        auto actual = cbd::decode_negative_int(after_major_type({0b001'11000, 0x64}));
        ASSERT_TRUE(actual);
        ASSERT_EQ(actual.value().value, -99);
    }
}

TEST(CBOR, ArgumentErrors) {
    assert_decode_error(
        cbd::decode_positive_int(cbd::bit_buffer{std::vector<uint8_t>{0x00}, 4}),
        cbd::cbor_error::premature_eof()
    );

    assert_decode_error(cbd::decode_positive_int(cbd::bit_buffer{}), cbd::cbor_error::premature_eof());

    for (uint8_t reserved : {28, 29, 30}) {
        assert_decode_error(
            cbd::decode_positive_int(after_major_type({reserved})),
            cbd::cbor_error::invalid_major_arg(reserved)
        );

        assert_decode_error(
            cbd::decode_negative_int(after_major_type({static_cast<uint8_t>(0b001'00000 | reserved)})),
            cbd::cbor_error::invalid_major_arg(reserved)
        );
    }

    assert_decode_error(cbd::decode_positive_int(after_major_type({0b000'11111})), cbd::cbor_error::unsupported(31));

    // Every extension width needs all of its bytes
    assert_decode_error(cbd::decode_positive_int(after_major_type({0b000'11000})), cbd::cbor_error::premature_eof());
    assert_decode_error(cbd::decode_positive_int(after_major_type({0b000'11001, 0x01})), cbd::cbor_error::premature_eof());
    assert_decode_error(
        cbd::decode_positive_int(after_major_type({0b000'11010, 0x01, 0x02, 0x03})),
        cbd::cbor_error::premature_eof()
    );
    assert_decode_error(
        cbd::decode_negative_int(after_major_type({0b001'11011, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07})),
        cbd::cbor_error::premature_eof()
    );
}
