#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>

namespace xfer::logger {

namespace {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

// timestamp [severity] [thread] message
auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
        << expr::smessage;
}

} // namespace

const char* to_string(severity_level level) {
    switch (level) {
        case logging::trivial::trace:   return "trace";
        case logging::trivial::debug:   return "debug";
        case logging::trivial::info:    return "info";
        case logging::trivial::warning: return "warning";
        case logging::trivial::error:   return "error";
        case logging::trivial::fatal:   return "fatal";
        default:                        return "unknown";
    }
}

std::optional<severity_level> parse_severity(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")   return logging::trivial::trace;
    if (lowered == "debug")   return logging::trivial::debug;
    if (lowered == "info")    return logging::trivial::info;
    if (lowered == "warning" || lowered == "warn") return logging::trivial::warning;
    if (lowered == "error")   return logging::trivial::error;
    if (lowered == "fatal")   return logging::trivial::fatal;
    return std::nullopt;
}

void init_logging(const LogOptions& options) {
    try {
        // Clear any existing sinks
        auto core = logging::core::get();
        core->remove_all_sinks();
        core->reset_filter();

        if (options.console) {
            auto console_sink = logging::add_console_log(
                std::clog,
                keywords::format = make_formatter(),
                keywords::auto_flush = true
            );
            console_sink->set_filter(logging::trivial::severity >= options.console_level);
        }

        if (!options.log_file.empty()) {
            std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
            auto file_sink = logging::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::rotation_size = options.rotation_size,
                keywords::format = make_formatter(),
                keywords::auto_flush = true
            );
            file_sink->set_filter(logging::trivial::severity >= options.file_level);
        }

        logging::add_common_attributes();
        core->set_logging_enabled(options.console || !options.log_file.empty());
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace xfer::logger
