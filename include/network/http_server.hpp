#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "network/http_session.hpp"
#include "network/router.hpp"

namespace xfer {
namespace network {

class HttpServer {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, uint16_t port, Router& router, std::uintmax_t max_body_bytes);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, closes live sessions and joins every worker thread
  void shutdown();


  // ---- GETTERS ----
  // Bound port, resolves port 0 to the one the system picked
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }
  std::size_t active_sessions();

private:
  struct Worker {
    std::shared_ptr<HttpSession> session;
    std::thread thread;
  };

  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  const std::uintmax_t max_body_bytes_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  Router& router_;

  // One thread per connection
  std::mutex workers_mutex_;
  std::list<Worker> workers_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void spawn_session(boost::asio::ip::tcp::socket socket);
  // Joins workers whose session has ended
  void reap_finished();
};

} // namespace network
} // namespace xfer
