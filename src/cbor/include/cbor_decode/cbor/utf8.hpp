#pragma once

#include <string_view>

namespace cbd {

// Strict UTF-8 validation per RFC 3629: overlong encodings, UTF-16 surrogates
// and code points above U+10FFFF are all rejected.
bool is_valid_utf8(std::string_view str);

}  // namespace cbd
