#include "cbor_decode/cbor/error.hpp"

namespace cbd {

std::string_view cbor_error_kind_name(cbor_error_kind kind) {
    switch (kind) {
        case cbor_error_kind::premature_eof: return "PrematureEOF";
        case cbor_error_kind::invalid_major_arg: return "InvalidMajorArg";
        case cbor_error_kind::incorrect_type: return "IncorrectType";
        case cbor_error_kind::malformed_utf8: return "MalformedUTF8";
        case cbor_error_kind::unsupported: return "Unsupported";
    }

    return "Unknown";
}

std::string cbor_error::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_error::dump_debug(std::stringstream& ss) const {
    ss << cbor_error_kind_name(_kind);

    switch (_kind) {
        case cbor_error_kind::invalid_major_arg:
        case cbor_error_kind::incorrect_type:
        case cbor_error_kind::unsupported:
            ss << '(' << static_cast<unsigned>(_argument) << ')';
            break;
        default:
            break;
    }
}

std::ostream& operator<<(std::ostream& os, const cbor_error& error) {
    return os << error.dump_debug();
}

cbor_decode_exception::cbor_decode_exception(const cbor_error& error)
    : std::runtime_error(fmt::format("CBOR decoding failed: {}", error)), _error(error) {}

}  // namespace cbd
