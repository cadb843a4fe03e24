#ifndef XFER_SERVER_OPTIONS_HPP
#define XFER_SERVER_OPTIONS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace xfer {
namespace server {

struct ServerOptions {
  std::string host = "0.0.0.0";
  uint16_t port = 5000;
  std::string upload_dir = "uploads";
  // Empty means a secret is generated at startup
  std::string api_key;
  std::uintmax_t max_upload_mb = 100;
  logger::severity_level log_level = boost::log::trivial::info;
  std::string log_file;

  bool show_help{false};
  bool valid{false};

  std::uintmax_t max_upload_bytes() const { return max_upload_mb * 1024 * 1024; }
};

// Reads $PORT and $API_KEY as defaults, then applies the flags.
// Errors are written to `err` and leave `valid` false.
ServerOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

void print_usage(const std::string& program_name, std::ostream& out);

} // namespace server
} // namespace xfer

#endif // XFER_SERVER_OPTIONS_HPP
