#include "server/server_options.hpp"
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace xfer {
namespace server {

namespace {

std::optional<uint16_t> parse_port(const std::string& text) {
  try {
    std::size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size() || value == 0 || value > std::numeric_limits<uint16_t>::max()) {
      return std::nullopt;
    }
    return static_cast<uint16_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<std::uintmax_t> parse_megabytes(const std::string& text) {
  try {
    std::size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed);
    // Upper bound keeps the byte count from overflowing
    if (consumed != text.size() || value == 0 || value > (1ULL << 40)) {
      return std::nullopt;
    }
    return static_cast<std::uintmax_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -h, --host <addr>          Listen address (default 0.0.0.0)\n"
      << "  -p, --port <port>          Listen port (default $PORT or 5000)\n"
      << "  -d, --dir <path>           Upload directory (default uploads)\n"
      << "  -k, --api-key <key>        Shared secret (default $API_KEY or generated)\n"
      << "  -m, --max-upload-mb <n>    Largest accepted upload in MiB (default 100)\n"
      << "  -l, --log-level <level>    trace|debug|info|warning|error|fatal (default info)\n"
      << "      --log-file <path>      Also log to a rotating file\n"
      << "      --help                 Show this message\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 5000 -k s3cret\n";
}

ServerOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_set<std::string> value_flags = {
    "-h", "--host",
    "-p", "--port",
    "-d", "--dir",
    "-k", "--api-key",
    "-m", "--max-upload-mb",
    "-l", "--log-level",
    "--log-file"
  };

  ServerOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "xfer-server";

  if (const char* env_port = std::getenv("PORT"); env_port && *env_port) {
    auto port = parse_port(env_port);
    if (!port) {
      err << "Error: Invalid PORT environment value: " << env_port << '\n';
      return options;
    }
    options.port = *port;
  }
  if (const char* env_key = std::getenv("API_KEY"); env_key && *env_key) {
    options.api_key = env_key;
  }

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (flag == "--help") {
      options.show_help = true;
      options.valid = true;
      return options;
    }
    if (value_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[i + 1]);

    if (flag == "-h" || flag == "--host") {
      options.host = value;
    } else if (flag == "-p" || flag == "--port") {
      auto port = parse_port(value);
      if (!port) {
        err << "Error: Invalid port number: " << value << '\n';
        return options;
      }
      options.port = *port;
    } else if (flag == "-d" || flag == "--dir") {
      options.upload_dir = value;
    } else if (flag == "-k" || flag == "--api-key") {
      options.api_key = value;
    } else if (flag == "-m" || flag == "--max-upload-mb") {
      auto megabytes = parse_megabytes(value);
      if (!megabytes) {
        err << "Error: Invalid upload limit: " << value << '\n';
        return options;
      }
      options.max_upload_mb = *megabytes;
    } else if (flag == "-l" || flag == "--log-level") {
      auto level = logger::parse_severity(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        return options;
      }
      options.log_level = *level;
    } else if (flag == "--log-file") {
      options.log_file = value;
    }
  }

  if (options.host.empty() || options.upload_dir.empty()) {
    err << "Error: Host and upload directory must not be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace server
} // namespace xfer
