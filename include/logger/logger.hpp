#ifndef XFER_LOGGER_HPP
#define XFER_LOGGER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <boost/log/trivial.hpp>

namespace xfer::logger {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
    // Console sink on stderr
    bool console = true;
    severity_level console_level = boost::log::trivial::info;

    // Rotating text file sink, disabled when empty
    std::string log_file;
    severity_level file_level = boost::log::trivial::debug;
    std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

// Replaces every installed sink with the ones `options` asks for.
// Components keep logging through BOOST_LOG_TRIVIAL.
void init_logging(const LogOptions& options);

// Accepts trace, debug, info, warning (or warn), error, fatal; case-insensitive
std::optional<severity_level> parse_severity(std::string_view text);

const char* to_string(severity_level level);

} // namespace xfer::logger

#endif // XFER_LOGGER_HPP
