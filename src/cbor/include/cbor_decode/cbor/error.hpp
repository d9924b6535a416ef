#pragma once

#include <cbor_decode/format.hpp>

#include <cstdint>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cbd {

enum class cbor_error_kind {
    // Not enough bits were left for the tag, argument or payload
    premature_eof,
    // Reserved additional information (28-30), or the major type handed to a
    // string or array decoder that does not accept it
    invalid_major_arg,
    // decode_int found a major type other than 0 or 1
    incorrect_type,
    malformed_utf8,
    // Additional information 31 (indefinite length)
    unsupported,
};

std::string_view cbor_error_kind_name(cbor_error_kind kind);

class cbor_error {
public:
    static cbor_error premature_eof() { return {cbor_error_kind::premature_eof, 0}; }
    static cbor_error invalid_major_arg(uint8_t x) { return {cbor_error_kind::invalid_major_arg, x}; }
    static cbor_error incorrect_type(uint8_t major_type) { return {cbor_error_kind::incorrect_type, major_type}; }
    static cbor_error malformed_utf8() { return {cbor_error_kind::malformed_utf8, 0}; }
    static cbor_error unsupported(uint8_t additional_info) { return {cbor_error_kind::unsupported, additional_info}; }

    cbor_error_kind kind() const { return _kind; }

    // The raw field carried by invalid_major_arg, incorrect_type and
    // unsupported; zero for the other kinds
    uint8_t argument() const { return _argument; }

    bool operator==(const cbor_error& rhs) const { return _kind == rhs._kind && _argument == rhs._argument; }
    bool operator!=(const cbor_error& rhs) const { return !(*this == rhs); }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    cbor_error(cbor_error_kind kind, uint8_t argument) : _kind(kind), _argument(argument) {}

    cbor_error_kind _kind;
    uint8_t _argument;
};

std::ostream& operator<<(std::ostream& os, const cbor_error& error);

// Thrown by value_or_throw() for callers that want exceptions at
// their own boundary
class cbor_decode_exception : public std::runtime_error {
public:
    explicit cbor_decode_exception(const cbor_error& error);

    const cbor_error& error() const { return _error; }

private:
    cbor_error _error;
};

}  // namespace cbd

template <>
struct fmt::formatter<cbd::cbor_error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const cbd::cbor_error& error, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(error.dump_debug(), ctx);
    }
};
