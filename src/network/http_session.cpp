#include "network/http_session.hpp"
#include <algorithm>
#include <vector>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_handler.hpp"

namespace xfer {
namespace network {

//==============================================
// CONSTRUCTOR
//==============================================

HttpSession::HttpSession(tcp::socket socket, Router& router, std::uintmax_t max_body_bytes)
  : socket_(std::move(socket))
  , router_(router)
  , max_body_bytes_(max_body_bytes) {
}


//==============================================
// SESSION CONTROL
//==============================================

void HttpSession::run() {
  beast::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Serving " << (ec ? std::string("unknown peer") : remote.address().to_string());

  try {
    while (handle_request()) {
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Session aborted: " << e.what();
  }

  do_close();
  finished_ = true;
}

void HttpSession::close() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_closed_) {
    return;
  }
  beast::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
}

void HttpSession::do_close() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_closed_) {
    return;
  }
  socket_closed_ = true;
  beast::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_send, ec);
  socket_.close(ec);
}


//==============================================
// REQUEST PROCESSING
//==============================================

bool HttpSession::handle_request() {
  http::request_parser<http::buffer_body> parser;
  parser.header_limit(MAX_HEADER_BYTES);
  // An oversized Content-Length must reach the router so it can answer 413
  parser.body_limit(boost::none);

  beast::error_code ec;
  http::read_header(socket_, buffer_, parser, ec);
  if (ec == http::error::end_of_stream) {
    return false;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Read error: " << ec.message();
    return false;
  }

  parser.body_limit(max_body_bytes_);

  RequestHead head{parser.get().base()};
  std::optional<std::uintmax_t> content_length;
  if (auto declared = parser.content_length()) {
    content_length = *declared;
  }

  SessionBodyReader reader(socket_, buffer_, parser);
  Reply reply = router_.route(head, reader, content_length);

  // An unread body leaves the stream unusable for another request
  bool close = !head.keep_alive() || !reader.complete();
  write_reply(reply, close);
  return !close;
}

void HttpSession::write_reply(Reply& reply, bool& close) {
  if (auto* res = std::get_if<http::response<http::string_body>>(&reply)) {
    if (close) {
      res->keep_alive(false);
    }

    beast::error_code ec;
    http::write(socket_, *res, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP session: Write error: " << ec.message();
      close = true;
    }
    return;
  }

  write_stream_reply(std::get<StreamReply>(reply), close);
}

void HttpSession::write_stream_reply(StreamReply& reply, bool& close) {
  if (close) {
    reply.header.keep_alive(false);
  }

  http::response<http::buffer_body> res{std::move(reply.header.base())};
  res.body().data = nullptr;
  res.body().more = true;
  http::response_serializer<http::buffer_body> sr{res};

  beast::error_code ec;
  http::write_header(socket_, sr, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to write download header: " << ec.message();
    close = true;
    return;
  }

  std::vector<char> chunk(transfer::TransferHandler::TRANSFER_CHUNK_SIZE);
  std::uintmax_t remaining = reply.length;

  while (remaining > 0) {
    std::size_t want = static_cast<std::size_t>(std::min<std::uintmax_t>(chunk.size(), remaining));
    reply.body->read(chunk.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(reply.body->gcount());
    if (got == 0) {
      // Status is already on the wire; dropping the connection is the only
      // way left to signal the short body
      BOOST_LOG_TRIVIAL(error) << "HTTP session: Blob ended " << remaining << " bytes early, dropping connection";
      close = true;
      return;
    }
    remaining -= got;

    res.body().data = chunk.data();
    res.body().size = got;
    res.body().more = true;
    http::write(socket_, sr, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP session: Download aborted with " << remaining
                                 << " bytes left: " << ec.message();
      close = true;
      return;
    }
  }

  res.body().data = nullptr;
  res.body().size = 0;
  res.body().more = false;
  http::write(socket_, sr, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to finish download: " << ec.message();
    close = true;
  }
}


//==============================================
// SESSION BODY READER
//==============================================

SessionBodyReader::SessionBodyReader(tcp::socket& socket, beast::flat_buffer& buffer,
                                     http::request_parser<http::buffer_body>& parser)
  : socket_(socket)
  , buffer_(buffer)
  , parser_(parser) {
}

std::size_t SessionBodyReader::read_some(char* buffer, std::size_t capacity) {
  if (parser_.is_done()) {
    return 0;
  }

  if (!continue_sent_) {
    continue_sent_ = true;
    if (beast::iequals(parser_.get()[http::field::expect], "100-continue")) {
      http::response<http::empty_body> interim{http::status::continue_, parser_.get().version()};
      http::write(socket_, interim);
    }
  }

  while (!parser_.is_done()) {
    parser_.get().body().data = buffer;
    parser_.get().body().size = capacity;

    beast::error_code ec;
    http::read(socket_, buffer_, parser_, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP session: Request body exceeded limit";
      throw transfer::TransferError(transfer::ErrorKind::PayloadTooLarge, "File too large");
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP session: Body read error: " << ec.message();
      throw beast::system_error(ec);
    }

    std::size_t produced = capacity - parser_.get().body().size;
    if (produced > 0) {
      return produced;
    }
  }
  return 0;
}

} // namespace network
} // namespace xfer
