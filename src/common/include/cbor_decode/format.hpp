#pragma once

// spdlog is built against the system fmt, so link fmt as a compiled library
// rather than forcing FMT_HEADER_ONLY here
#include <fmt/format.h>
