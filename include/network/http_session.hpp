#ifndef XFER_NETWORK_HTTP_SESSION_HPP
#define XFER_NETWORK_HTTP_SESSION_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "network/router.hpp"
#include "transfer/body_reader.hpp"

namespace xfer {
namespace network {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

// Serves the requests of one connection with blocking I/O on the calling
// thread. Request bodies are pulled through a BodyReader and response bodies
// pushed in bounded chunks, so neither side is ever held in memory whole.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  // Delete copy operations to prevent socket duplication
  HttpSession(const HttpSession&) = delete;
  HttpSession& operator=(const HttpSession&) = delete;


  // ---- CONSTRUCTOR ----
  HttpSession(tcp::socket socket, Router& router, std::uintmax_t max_body_bytes);


  // ---- SESSION CONTROL ----
  // Serves requests until the peer closes, an error occurs or close() is called
  void run();
  // Unblocks a running session from another thread. Only shuts the socket
  // down; the session thread itself closes it.
  void close();

  bool finished() const { return finished_; }

  // Header block limit per request
  static constexpr std::uint32_t MAX_HEADER_BYTES = 16 * 1024;

private:
  // ---- PARAMETERS ----
  tcp::socket socket_;
  beast::flat_buffer buffer_;
  Router& router_;
  const std::uintmax_t max_body_bytes_;
  std::atomic<bool> finished_{false};
  // Serializes close() against do_close() so a shutdown never reaches a
  // descriptor the session thread has already released
  std::mutex socket_mutex_;
  bool socket_closed_{false};


  // ---- REQUEST PROCESSING ----
  // Handles one request, returns false when the connection must close
  bool handle_request();
  void write_reply(Reply& reply, bool& close);
  void write_stream_reply(StreamReply& reply, bool& close);
  void do_close();
};

// BodyReader over the body of a request whose header has been read.
// Sends "100 Continue" on first use when the client asked for it, so a
// rejected request never has its body transmitted.
class SessionBodyReader : public transfer::BodyReader {
public:
  SessionBodyReader(tcp::socket& socket, beast::flat_buffer& buffer,
                    http::request_parser<http::buffer_body>& parser);

  std::size_t read_some(char* buffer, std::size_t capacity) override;

  // True once the whole body has been consumed
  bool complete() const { return parser_.is_done(); }

private:
  tcp::socket& socket_;
  beast::flat_buffer& buffer_;
  http::request_parser<http::buffer_body>& parser_;
  bool continue_sent_{false};
};

} // namespace network
} // namespace xfer

#endif // XFER_NETWORK_HTTP_SESSION_HPP
