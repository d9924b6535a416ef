#include "cbor_decode/util.hpp"

#include "cbor_decode/format.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>

namespace cbd {

namespace {

constexpr const size_t DUMP_BINARY_LINE_LENGTH = 16;

void dump_binary_line(std::stringstream& ss, const uint8_t* buffer, size_t length) {
    for (size_t i = 0; i < length; i++) {
        ss << fmt::format("{:02x} ", buffer[i]);
    }

    // Pad a short last line so its ASCII column lines up with the others
    ss << std::string((DUMP_BINARY_LINE_LENGTH - length) * 3, ' ') << ' ';

    for (size_t i = 0; i < length; i++) {
        bool printable = buffer[i] >= 0x20 && buffer[i] <= 0x7e;
        ss << (printable ? static_cast<char>(buffer[i]) : '.');
    }

    ss << "\n";
}

}  // namespace

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length) {
    for (size_t i = 0; i < length; i += DUMP_BINARY_LINE_LENGTH) {
        ss << fmt::format("{:04x}: ", i);
        dump_binary_line(ss, buffer + i, std::min(DUMP_BINARY_LINE_LENGTH, length - i));
    }
}

std::optional<std::string> get_environment_variable(const std::string& variable_name) {
    return get_environment_variable(variable_name.c_str());
}

std::optional<std::string> get_environment_variable(const char* variable_name) {
    const char* env_var_value = std::getenv(variable_name);
    if (env_var_value == nullptr) {
        return std::nullopt;
    }

    return std::string(env_var_value);
}

void set_up_logger(std::string_view log_name) {
    auto logger = spdlog::stderr_color_mt(std::string{log_name});

    auto debug_setting = get_environment_variable("CBOR_DECODE_DEBUG");
    if (!debug_setting) {
        logger->set_level(spdlog::level::warn);
    } else if (*debug_setting == "trace") {
        logger->set_level(spdlog::level::trace);
    } else {
        logger->set_level(spdlog::level::debug);
    }

    spdlog::set_default_logger(logger);
}

void log_multiline(std::stringstream& data, const std::string& indent_str) {
    std::string token;
    while (std::getline(data, token, '\n')) {
        spdlog::debug("{}{}", indent_str, token);
    }
}

void log_multiline_binary(const uint8_t* buffer, size_t length, const std::string& indent_str) {
    // The dump is only ever logged at debug level
    if (!spdlog::should_log(spdlog::level::debug)) {
        return;
    }

    std::stringstream ss;
    dump_binary(ss, buffer, length);
    log_multiline(ss, indent_str);
}

}  // namespace cbd
