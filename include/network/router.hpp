#ifndef XFER_NETWORK_ROUTER_HPP
#define XFER_NETWORK_ROUTER_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "transfer/transfer_handler.hpp"

namespace xfer {
namespace network {

namespace http = boost::beast::http;

// Request line and headers; bodies are pulled separately through a BodyReader
using RequestHead = http::request<http::empty_body>;

// Response whose body is drained from a stream in bounded chunks.
// `header` already carries Content-Length == `length`.
struct StreamReply {
  http::response<http::empty_body> header;
  std::unique_ptr<std::istream> body;
  std::uintmax_t length{0};
};

using Reply = std::variant<http::response<http::string_body>, StreamReply>;

// Maps HTTP requests onto TransferHandler operations and TransferErrors onto
// status codes. API routes take a bearer token and answer JSON; the
// browser routes take ?api_key= (or an api_key form field for /upload-web)
// and answer plain text.
class Router {
public:
  // ---- CONSTRUCTOR ----
  explicit Router(transfer::TransferHandler& handler);


  // ---- DISPATCH ----
  // `body` is only read by routes that accept a request body
  Reply route(const RequestHead& req,
              transfer::BodyReader& body,
              std::optional<std::uintmax_t> content_length);


  // ---- RESPONSE BUILDERS ----
  static http::response<http::string_body> make_json_response(http::status status, const nlohmann::json& body,
                                                              const RequestHead& req);
  static http::response<http::string_body> make_text_response(http::status status, const std::string& body,
                                                              const RequestHead& req);
  static http::status status_for(transfer::ErrorKind kind);


  // ---- TARGET PARSING ----
  // Decodes %XX escapes and '+' in query strings
  static std::string url_decode(std::string_view text, bool plus_as_space);
  static std::map<std::string, std::string> parse_query(std::string_view query);

private:
  // ---- PARAMETERS ----
  transfer::TransferHandler& handler_;


  // ---- API ROUTES (JSON) ----
  Reply handle_upload(const RequestHead& req, transfer::BodyReader& body,
                      std::optional<std::uintmax_t> content_length);
  Reply handle_list(const RequestHead& req);
  Reply handle_api_download(const RequestHead& req, const std::string& id);
  Reply handle_api_delete(const RequestHead& req, const std::string& id);


  // ---- BROWSER-LINK ROUTES (TEXT) ----
  Reply handle_form_upload(const RequestHead& req, transfer::BodyReader& body,
                           std::optional<std::uintmax_t> content_length, const std::string& api_key);
  Reply handle_link_download(const RequestHead& req, const std::string& id, const std::string& api_key);
  Reply handle_link_delete(const RequestHead& req, const std::string& id, const std::string& api_key);


  // ---- HELPERS ----
  static std::string_view bearer_token(const RequestHead& req);
  static StreamReply make_download_reply(transfer::DownloadTicket ticket, const RequestHead& req);
  static Reply json_error(const transfer::TransferError& e, const RequestHead& req);
};

} // namespace network
} // namespace xfer

#endif // XFER_NETWORK_ROUTER_HPP
