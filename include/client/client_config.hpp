#ifndef XFER_CLIENT_CONFIG_HPP
#define XFER_CLIENT_CONFIG_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace xfer {
namespace client {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

struct ClientConfig {
  // Base URL without trailing '/', e.g. "http://127.0.0.1:5000"
  std::string server_url;
  std::string api_key;
};

// Persists ClientConfig as {"server_url": ..., "api_key": ...}
class ConfigStore {
public:
  static constexpr const char* DEFAULT_FILE = "filetransfer_config.json";
  static constexpr const char* PATH_ENV = "XFER_CONFIG";

  // ---- CONSTRUCTOR ----
  explicit ConfigStore(std::filesystem::path path);

  // $XFER_CONFIG if set, otherwise DEFAULT_FILE in the working directory
  static std::filesystem::path default_path();


  // ---- PERSISTENCE ----
  // std::nullopt when no file exists, ConfigError when it cannot be parsed
  std::optional<ClientConfig> load() const;
  void save(const ClientConfig& config) const;
  // Returns false if there was nothing to remove
  bool remove() const;


  // ---- INTERACTIVE SETUP ----
  // Loads the stored config, prompting on `in`/`out` when it is missing.
  // A corrupt file is reported, deleted and replaced through the prompt.
  ClientConfig load_or_prompt(std::istream& in, std::ostream& out);
  // Discards the stored config and prompts for a new one
  ClientConfig reconfigure(std::istream& in, std::ostream& out);

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;

  ClientConfig prompt(std::istream& in, std::ostream& out);
};

// Parses the JSON text of a config file, throws ConfigError, also when
// server_url is not a URL the client can connect to
ClientConfig parse_config(const std::string& text);
std::string serialize_config(const ClientConfig& config);

} // namespace client
} // namespace xfer

#endif // XFER_CLIENT_CONFIG_HPP
