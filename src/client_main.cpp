#include "cli/cli.hpp"
#include "client/client_config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  // Keep stdout for the operator, diagnostics go to a file
  xfer::logger::LogOptions log_options;
  log_options.console = false;
  log_options.log_file = "xfer-client.log";
  log_options.file_level = boost::log::trivial::warning;
  try {
    xfer::logger::init_logging(log_options);
  } catch (const std::exception&) {
    return 1;
  }

  xfer::client::ConfigStore config_store(xfer::client::ConfigStore::default_path());
  xfer::cli::CLI cli(config_store, std::cin, std::cout);

  if (argc < 2) {
    cli.run();
    return 0;
  }

  std::vector<std::string> args(argv + 1, argv + argc);
  return cli.run_command(args);
}
