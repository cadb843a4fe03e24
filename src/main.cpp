#include "server/bootstrap.hpp"
#include "logger/logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>

bool run_server(const xfer::server::ServerOptions& options) {
  try {
    xfer::server::Bootstrap server(options);

    if (!server.start()) {
      std::cerr << "Error: Failed to start server on " << options.host << ":" << options.port << '\n';
      return false;
    }

    std::cout << "File transfer server listening on http://" << options.host << ":" << server.port() << '\n'
              << "Upload directory: " << options.upload_dir << '\n'
              << "API key: " << server.api_key() << '\n'
              << "Press Ctrl+C to stop" << std::endl;

    // Block until SIGINT/SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", stopping";
      }
    });
    signal_context.run();

    return server.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = xfer::server::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    xfer::server::print_usage(argv[0], std::cout);
    return 0;
  }

  xfer::logger::LogOptions log_options;
  log_options.console_level = options.log_level;
  log_options.log_file = options.log_file;
  try {
    xfer::logger::init_logging(log_options);
  } catch (const std::exception&) {
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
