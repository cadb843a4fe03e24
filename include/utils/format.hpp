#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace xfer {
namespace utils {

// Local time as "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(std::chrono::system_clock::time_point when);

// Bytes as kilobytes with one decimal, e.g. "12.5 KB"
std::string format_kb(std::uintmax_t bytes);

} // namespace utils
} // namespace xfer
