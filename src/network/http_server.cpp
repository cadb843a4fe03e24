#include "network/http_server.hpp"

namespace xfer {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, Router& router, std::uintmax_t max_body_bytes)
  : address_(address)
  , port_(port)
  , max_body_bytes_(max_body_bytes)
  , is_running_(false)
  , router_(router) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Endpoint created";

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (error == boost::asio::error::operation_aborted) {
        return;
      }
      if (!error) {
        reap_finished();
        spawn_session(std::move(*socket));
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::spawn_session(boost::asio::ip::tcp::socket socket) {
  auto session = std::make_shared<HttpSession>(std::move(socket), router_, max_body_bytes_);

  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (!is_running_) {
    session->close();
    return;
  }
  workers_.push_back(Worker{session, std::thread([session]() { session->run(); })});
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Session started, " << workers_.size() << " active";
}

void HttpServer::reap_finished() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->session->finished()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void HttpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.session->close();
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::local_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return port_;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

std::size_t HttpServer::active_sessions() {
  reap_finished();
  std::lock_guard<std::mutex> lock(workers_mutex_);
  return workers_.size();
}

} // namespace network
} // namespace xfer
