#pragma once

#include <cbor_decode/types.hpp>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace cbd {

#define COPYABLE(class_name) \
    class_name(const class_name&) = default; \
    class_name& operator=(const class_name&) = default

#define NON_COPYABLE(class_name) \
    class_name(const class_name&) = delete; \
    class_name& operator=(const class_name&) = delete

#define MOVABLE(class_name) \
    class_name(class_name&&) = default; \
    class_name& operator=(class_name&&) = default

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length);

std::optional<std::string> get_environment_variable(const std::string& variable_name);
std::optional<std::string> get_environment_variable(const char* variable_name);

// Installs a stderr logger named `log_name` as the spdlog default. The level
// is `warn` unless CBOR_DECODE_DEBUG is set (`debug`, or `trace` when its
// value is "trace").
void set_up_logger(std::string_view log_name);

void log_multiline(std::stringstream& data, const std::string& indent_str = "");
void log_multiline_binary(const uint8_t* buffer, size_t length, const std::string& indent_str = "");

}  // namespace cbd
