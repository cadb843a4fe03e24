#include "client/client_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include "client/transfer_client.hpp"

namespace xfer {
namespace client {

namespace {

std::string trim(const std::string& text) {
  const char* whitespace = " \t\r\n";
  std::size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return {};
  }
  std::size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace


//==============================================
// SERIALIZATION
//==============================================

ClientConfig parse_config(const std::string& text) {
  try {
    auto json = nlohmann::json::parse(text);
    ClientConfig config;
    config.server_url = strip_trailing_slashes(json.at("server_url").get<std::string>());
    config.api_key = json.at("api_key").get<std::string>();
    if (config.server_url.empty()) {
      throw ConfigError("server_url is empty");
    }
    ServerUrl::parse(config.server_url);
    return config;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  } catch (const NetworkError& e) {
    throw ConfigError(std::string("Unusable server_url: ") + e.what());
  }
}

std::string serialize_config(const ClientConfig& config) {
  nlohmann::json json = {
    {"server_url", config.server_url},
    {"api_key", config.api_key}
  };
  return json.dump(2);
}


//==============================================
// CONSTRUCTOR
//==============================================

ConfigStore::ConfigStore(std::filesystem::path path) : path_(std::move(path)) {
}

std::filesystem::path ConfigStore::default_path() {
  if (const char* env_path = std::getenv(PATH_ENV); env_path && *env_path) {
    return env_path;
  }
  return DEFAULT_FILE;
}


//==============================================
// PERSISTENCE
//==============================================

std::optional<ClientConfig> ConfigStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }

  std::ifstream file(path_);
  if (!file) {
    throw ConfigError("Cannot open " + path_.string());
  }
  std::stringstream contents;
  contents << file.rdbuf();

  ClientConfig config = parse_config(contents.str());
  BOOST_LOG_TRIVIAL(debug) << "Client config: Loaded " << path_.string();
  return config;
}

void ConfigStore::save(const ClientConfig& config) const {
  std::ofstream file(path_, std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Client config: Cannot write " << path_.string();
    throw ConfigError("Cannot write " + path_.string());
  }
  file << serialize_config(config) << '\n';
  file.close();
  if (file.fail()) {
    throw ConfigError("Failed to write " + path_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Client config: Saved " << path_.string();
}

bool ConfigStore::remove() const {
  std::error_code ec;
  bool removed = std::filesystem::remove(path_, ec);
  if (ec) {
    throw ConfigError("Cannot remove " + path_.string() + ": " + ec.message());
  }
  return removed;
}


//==============================================
// INTERACTIVE SETUP
//==============================================

ClientConfig ConfigStore::load_or_prompt(std::istream& in, std::ostream& out) {
  try {
    if (auto config = load()) {
      return *config;
    }
  } catch (const ConfigError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Client config: Discarding unreadable " << path_.string() << ": " << e.what();
    out << "Error loading configuration: " << e.what() << '\n';
    remove();
  }

  out << "First-time setup: Please enter your server details.\n";
  return prompt(in, out);
}

ClientConfig ConfigStore::reconfigure(std::istream& in, std::ostream& out) {
  remove();
  return prompt(in, out);
}

ClientConfig ConfigStore::prompt(std::istream& in, std::ostream& out) {
  ClientConfig config;
  std::string line;

  while (config.server_url.empty()) {
    out << "Enter the server URL (e.g., http://127.0.0.1:5000): " << std::flush;
    if (!std::getline(in, line)) {
      throw ConfigError("Setup aborted");
    }
    std::string url = strip_trailing_slashes(trim(line));
    if (url.empty()) {
      continue;
    }
    try {
      ServerUrl::parse(url);
    } catch (const NetworkError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Client config: Rejected server URL " << url << ": " << e.what();
      out << "Invalid server URL: " << e.what() << '\n';
      continue;
    }
    config.server_url = url;
  }

  out << "Enter the API key (from server): " << std::flush;
  if (!std::getline(in, line)) {
    throw ConfigError("Setup aborted");
  }
  config.api_key = trim(line);

  save(config);
  out << "Configuration saved to " << path_.string() << '\n';
  return config;
}

} // namespace client
} // namespace xfer
