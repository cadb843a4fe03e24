#include "client/transfer_client.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include "crypto/random.hpp"
#include "network/multipart_parser.hpp"
#include "utils/filename.hpp"

namespace xfer {
namespace client {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "xfer-client/1.0";
// Error bodies are short; anything past this is not worth buffering
constexpr std::size_t MAX_ERROR_BODY = 64 * 1024;

std::string to_string(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void close_socket(tcp::socket& socket) {
  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);
}

void check_ok(const http::response<http::string_body>& res) {
  unsigned status = res.result_int();
  if (status / 100 != 2) {
    throw NetworkError(describe_error(status, to_string(res[http::field::content_type]), res.body()), status);
  }
}

nlohmann::json parse_json_body(const http::response<http::string_body>& res) {
  try {
    return nlohmann::json::parse(res.body());
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Unparseable response body: " << e.what();
    throw NetworkError("Malformed server response");
  }
}

// Quoted-string form of a filename for Content-Disposition
std::string quote_filename(const std::string& name) {
  std::string quoted;
  for (char c : name) {
    if (c == '"') {
      quoted += "%22";
    } else if (c == '\r' || c == '\n') {
      continue;
    } else {
      quoted.push_back(c);
    }
  }
  return quoted;
}

} // namespace


//==============================================
// SERVER URL
//==============================================

ServerUrl ServerUrl::parse(const std::string& url) {
  std::string_view rest(url);

  std::size_t scheme_end = rest.find("://");
  if (scheme_end != std::string_view::npos) {
    std::string scheme(rest.substr(0, scheme_end));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http") {
      throw NetworkError("Unsupported URL scheme '" + scheme + "' in " + url + " (only http is supported)");
    }
    rest = rest.substr(scheme_end + 3);
  }

  std::size_t slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  std::string_view path = slash == std::string_view::npos ? std::string_view() : rest.substr(slash);

  ServerUrl parsed;
  parsed.port = "80";

  if (!authority.empty() && authority.front() == '[') {
    std::size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      throw NetworkError("Malformed server URL: " + url);
    }
    parsed.host = std::string(authority.substr(1, close - 1));
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':' || after.size() == 1) {
        throw NetworkError("Malformed server URL: " + url);
      }
      parsed.port = std::string(after.substr(1));
    }
  } else {
    std::size_t colon = authority.rfind(':');
    parsed.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      parsed.port = std::string(authority.substr(colon + 1));
    }
  }

  if (parsed.host.empty()) {
    throw NetworkError("Server URL has no host: " + url);
  }
  if (parsed.port.empty() || !std::all_of(parsed.port.begin(), parsed.port.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
    throw NetworkError("Invalid port in server URL: " + url);
  }

  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  parsed.base_path = std::string(path);
  return parsed;
}

std::string ServerUrl::host_header() const {
  std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return port == "80" ? name : name + ":" + port;
}


//==============================================
// FREE HELPERS
//==============================================

std::string describe_error(unsigned status, const std::string& content_type, const std::string& body) {
  if (content_type.find("json") != std::string::npos) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("error") && json["error"].is_string()) {
      return json["error"].get<std::string>();
    }
  }

  std::string text = body;
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.pop_back();
  }
  if (!text.empty()) {
    return text;
  }
  return to_string(http::obsolete_reason(static_cast<http::status>(status)));
}

std::string encode_path_segment(const std::string& segment) {
  static const char* hex = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(hex[c >> 4]);
      encoded.push_back(hex[c & 0x0F]);
    }
  }
  return encoded;
}


//==============================================
// CONSTRUCTOR
//==============================================

TransferClient::TransferClient(ClientConfig config)
  : config_(std::move(config))
  , url_(ServerUrl::parse(config_.server_url)) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer client: Using " << url_.host << ":" << url_.port << url_.base_path;
}


//==============================================
// OPERATIONS
//==============================================

UploadResult TransferClient::upload(const std::filesystem::path& file) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw std::invalid_argument("File " + file.string() + " not found.");
  }
  const std::uintmax_t file_size = std::filesystem::file_size(file);

  std::ifstream input(file, std::ios::binary);
  if (!input) {
    throw std::runtime_error("Cannot open " + file.string());
  }

  const std::string boundary = "xfer-" + crypto::random_hex(16);
  const std::string preamble =
    "--" + boundary + "\r\n"
    "Content-Disposition: form-data; name=\"file\"; filename=\"" + quote_filename(file.filename().string()) + "\"\r\n"
    "Content-Type: application/octet-stream\r\n"
    "\r\n";
  const std::string epilogue = "\r\n--" + boundary + "--\r\n";

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Uploading " << file.string() << " (" << file_size << " bytes)";
  auto start = std::chrono::steady_clock::now();
  auto socket = connect();

  try {
    http::request<http::buffer_body> req{http::verb::post, target("/api/upload"), 11};
    set_common_headers(req);
    req.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
    req.set(http::field::expect, "100-continue");
    req.content_length(preamble.size() + file_size + epilogue.size());
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> sr{req};
    http::write_header(socket, sr);

    // The server answers before the body is sent if it rejects the request
    beast::flat_buffer buffer;
    {
      http::response<http::string_body> interim;
      http::read(socket, buffer, interim);
      if (interim.result() != http::status::continue_) {
        close_socket(socket);
        unsigned status = interim.result_int();
        throw NetworkError(describe_error(status, to_string(interim[http::field::content_type]), interim.body()), status);
      }
    }

    auto write_chunk = [&](const char* data, std::size_t size, bool more) {
      req.body().data = const_cast<char*>(data);
      req.body().size = size;
      req.body().more = more;
      beast::error_code write_ec;
      http::write(socket, sr, write_ec);
      if (write_ec == http::error::need_buffer) {
        write_ec = {};
      }
      if (write_ec) {
        throw beast::system_error(write_ec);
      }
    };

    write_chunk(preamble.data(), preamble.size(), true);

    std::vector<char> chunk(CHUNK_SIZE);
    std::uintmax_t sent = 0;
    while (input.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || input.gcount() > 0) {
      std::size_t n = static_cast<std::size_t>(input.gcount());
      write_chunk(chunk.data(), n, true);
      sent += n;
    }
    if (input.bad() || sent != file_size) {
      close_socket(socket);
      throw std::runtime_error("File " + file.string() + " changed while uploading");
    }

    write_chunk(epilogue.data(), epilogue.size(), true);
    write_chunk(nullptr, 0, false);

    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    close_socket(socket);
    check_ok(res);

    auto json = parse_json_body(res);
    UploadResult result;
    try {
      result.id = json.contains("file_id") ? json.at("file_id").get<std::string>() : json.at("id").get<std::string>();
      result.filename = json.value("filename", file.filename().string());
      result.size = json.value("size", file_size);
    } catch (const nlohmann::json::exception& e) {
      throw NetworkError(std::string("Malformed upload response: ") + e.what());
    }
    result.seconds = seconds_since(start);

    BOOST_LOG_TRIVIAL(info) << "Transfer client: Uploaded as " << result.id << " in " << result.seconds << "s";
    return result;
  } catch (const boost::system::system_error& e) {
    close_socket(socket);
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Upload failed: " << e.code().message();
    throw NetworkError("Upload failed: " + e.code().message());
  }
}

std::vector<RemoteFile> TransferClient::list() {
  auto socket = connect();

  try {
    http::request<http::empty_body> req{http::verb::get, target("/api/files"), 11};
    set_common_headers(req);
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    close_socket(socket);
    check_ok(res);

    auto json = parse_json_body(res);
    std::vector<RemoteFile> files;
    try {
      for (const auto& entry : json.at("files")) {
        RemoteFile file;
        file.id = entry.at("id").get<std::string>();
        file.filename = entry.at("filename").get<std::string>();
        file.size = entry.at("size").get<std::uintmax_t>();
        file.timestamp = entry.value("timestamp", std::string());
        files.push_back(std::move(file));
      }
    } catch (const nlohmann::json::exception& e) {
      throw NetworkError(std::string("Malformed file list: ") + e.what());
    }
    return files;
  } catch (const boost::system::system_error& e) {
    close_socket(socket);
    BOOST_LOG_TRIVIAL(error) << "Transfer client: List failed: " << e.code().message();
    throw NetworkError("List failed: " + e.code().message());
  }
}

DownloadResult TransferClient::download(const std::string& id, const std::filesystem::path& dest,
                                        const ProgressFn& progress) {
  auto start = std::chrono::steady_clock::now();
  auto socket = connect();

  try {
    http::request<http::empty_body> req{http::verb::get, target("/api/download/" + encode_path_segment(id)), 11};
    set_common_headers(req);
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    http::read_header(socket, buffer, parser);

    std::vector<char> chunk(CHUNK_SIZE);
    auto read_chunk = [&]() -> std::size_t {
      while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();
        beast::error_code read_ec;
        http::read(socket, buffer, parser, read_ec);
        if (read_ec == http::error::need_buffer) {
          read_ec = {};
        }
        if (read_ec) {
          throw beast::system_error(read_ec);
        }
        std::size_t n = chunk.size() - parser.get().body().size;
        if (n > 0) {
          return n;
        }
      }
      return 0;
    };

    const auto& res = parser.get();
    unsigned status = res.result_int();
    if (status / 100 != 2) {
      std::string body;
      while (!parser.is_done() && body.size() < MAX_ERROR_BODY) {
        std::size_t n = read_chunk();
        body.append(chunk.data(), n);
      }
      close_socket(socket);
      throw NetworkError(describe_error(status, to_string(res[http::field::content_type]), body), status);
    }

    std::optional<std::uintmax_t> total;
    if (auto declared = parser.content_length()) {
      total = *declared;
    }

    std::filesystem::path final_path = dest;
    std::error_code ec;
    if (std::filesystem::is_directory(dest, ec)) {
      std::string name;
      auto disposition = res.find(http::field::content_disposition);
      if (disposition != res.end()) {
        std::string value = to_string(disposition->value());
        auto params = network::parse_header_params(value);
        auto filename = params.find("filename");
        if (filename != params.end()) {
          name = utils::sanitize_filename(filename->second);
        }
      }
      if (name.empty()) {
        name = "download_" + utils::sanitize_filename(id);
      }
      final_path = dest / name;
    }

    std::filesystem::path part_path = final_path;
    part_path += ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      close_socket(socket);
      throw std::runtime_error("Cannot write " + part_path.string());
    }

    BOOST_LOG_TRIVIAL(info) << "Transfer client: Downloading " << id << " to " << part_path.string();
    std::uintmax_t received = 0;
    while (!parser.is_done()) {
      std::size_t n = read_chunk();
      if (n == 0) {
        break;
      }
      out.write(chunk.data(), static_cast<std::streamsize>(n));
      if (!out) {
        close_socket(socket);
        throw std::runtime_error("Failed writing " + part_path.string());
      }
      received += n;
      if (progress) {
        progress(received, total);
      }
    }
    close_socket(socket);

    out.close();
    if (out.fail()) {
      throw std::runtime_error("Failed writing " + part_path.string());
    }

    std::filesystem::rename(part_path, final_path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Transfer client: Cannot move " << part_path.string() << " into place: " << ec.message();
      throw std::runtime_error("Cannot rename " + part_path.string() + ": " + ec.message());
    }

    BOOST_LOG_TRIVIAL(info) << "Transfer client: Downloaded " << received << " bytes to " << final_path.string();
    return DownloadResult{final_path, received, seconds_since(start)};
  } catch (const boost::system::system_error& e) {
    close_socket(socket);
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Download of " << id << " failed: " << e.code().message();
    throw NetworkError("Download failed: " + e.code().message());
  }
}

void TransferClient::remove(const std::string& id) {
  auto socket = connect();

  try {
    http::request<http::empty_body> req{http::verb::delete_, target("/api/files/" + encode_path_segment(id)), 11};
    set_common_headers(req);
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    close_socket(socket);
    check_ok(res);
    BOOST_LOG_TRIVIAL(info) << "Transfer client: Deleted " << id;
  } catch (const boost::system::system_error& e) {
    close_socket(socket);
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Delete of " << id << " failed: " << e.code().message();
    throw NetworkError("Delete failed: " + e.code().message());
  }
}


//==============================================
// CONNECTION
//==============================================

tcp::socket TransferClient::connect() {
  tcp::resolver resolver(io_context_);
  tcp::socket socket(io_context_);
  try {
    auto endpoints = resolver.resolve(url_.host, url_.port);
    boost::asio::connect(socket, endpoints);
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Connection to " << config_.server_url << " failed: " << e.what();
    throw NetworkError("Cannot connect to " + config_.server_url + ": " + e.code().message());
  }
  return socket;
}

std::string TransferClient::target(const std::string& path) const {
  return url_.base_path + path;
}

void TransferClient::set_common_headers(http::fields& fields) const {
  fields.set(http::field::host, url_.host_header());
  fields.set(http::field::user_agent, USER_AGENT);
  fields.set(http::field::authorization, "Bearer " + config_.api_key);
}

} // namespace client
} // namespace xfer
