#ifndef XFER_CLIENT_TRANSFER_CLIENT_HPP
#define XFER_CLIENT_TRANSFER_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "client/client_config.hpp"

namespace xfer {
namespace client {

// Transport failure, or a non-2xx answer when status() is non-zero
class NetworkError : public std::runtime_error {
public:
  explicit NetworkError(const std::string& message, unsigned status = 0)
    : std::runtime_error(message), status_(status) {}

  unsigned status() const { return status_; }

private:
  unsigned status_;
};

// Components of an "http://host[:port][/prefix]" base URL
struct ServerUrl {
  std::string host;
  std::string port;
  std::string base_path;

  // Throws NetworkError for other schemes or a missing host
  static ServerUrl parse(const std::string& url);
  // Value for the Host header
  std::string host_header() const;
};

struct RemoteFile {
  std::string id;
  std::string filename;
  std::uintmax_t size{0};
  std::string timestamp;
};

struct UploadResult {
  std::string id;
  std::string filename;
  std::uintmax_t size{0};
  double seconds{0.0};
};

struct DownloadResult {
  std::filesystem::path path;
  std::uintmax_t bytes{0};
  double seconds{0.0};
};

// Called after each received chunk; `total` is the declared Content-Length
using ProgressFn = std::function<void(std::uintmax_t received, std::optional<std::uintmax_t> total)>;

// Blocking HTTP client for the transfer API. Each call opens its own
// connection and sends the configured key as a bearer token.
class TransferClient {
public:
  // ---- CONSTRUCTOR ----
  explicit TransferClient(ClientConfig config);


  // ---- OPERATIONS ----
  // Streams `file` as multipart/form-data without loading it into memory
  UploadResult upload(const std::filesystem::path& file);
  std::vector<RemoteFile> list();
  // Writes to "<target>.part" and renames on completion. When `dest` is a
  // directory the server-declared filename is used inside it.
  DownloadResult download(const std::string& id, const std::filesystem::path& dest,
                          const ProgressFn& progress = {});
  void remove(const std::string& id);


  // ---- GETTERS ----
  const ClientConfig& config() const { return config_; }

  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

private:
  // ---- PARAMETERS ----
  ClientConfig config_;
  ServerUrl url_;
  boost::asio::io_context io_context_;


  // ---- CONNECTION ----
  boost::asio::ip::tcp::socket connect();
  std::string target(const std::string& path) const;
  void set_common_headers(boost::beast::http::fields& fields) const;
};

// Error text of a failed response: the "error" member of a JSON body,
// else the body itself, else the reason phrase
std::string describe_error(unsigned status, const std::string& content_type, const std::string& body);

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string encode_path_segment(const std::string& segment);

} // namespace client
} // namespace xfer

#endif // XFER_CLIENT_TRANSFER_CLIENT_HPP
