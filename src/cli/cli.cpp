#include "cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "utils/format.hpp"

namespace xfer {
namespace cli {

namespace {

const std::string RULE(50, '=');
const std::string TABLE_RULE(80, '-');

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string one_decimal(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  return oss.str();
}

} // namespace

std::vector<std::string> split_arguments(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> args;
  std::string word;
  while (iss >> word) {
    args.push_back(word);
  }
  return args;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::ConfigStore& config_store, std::istream& in, std::ostream& out)
  : running_(false)
  , in_(in)
  , out_(out)
  , config_store_(config_store) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized with config " << config_store_.path().string();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  try {
    transfer_client();
  } catch (const std::exception& e) {
    report_failure("loading configuration", e);
    return;
  }

  out_ << "\nFile Transfer Client\n" << RULE << '\n'
       << "Connected to: " << client_->config().server_url << '\n'
       << "Type 'help' for available commands\n";

  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  out_ << "\n> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    auto args = split_arguments(line);
    if (!args.empty()) {
      const std::string command = lowercase(args[0]);
      if (command == "exit" || command == "quit") {
        out_ << "Exiting..." << std::endl;
        running_ = false;
        continue;
      }
      if (!process_command(args)) {
        out_ << "Invalid command. Type 'help' for available commands." << std::endl;
      }
    }

    if (running_) {
      out_ << "\n> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}

int CLI::run_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    handle_help_command();
    return 1;
  }

  const std::string command = lowercase(args[0]);
  if (command == "help") {
    handle_help_command();
    return 0;
  }

  try {
    if (command == "config") {
      handle_config_command();
      return 0;
    }
    transfer_client();
  } catch (const std::exception& e) {
    report_failure("loading configuration", e);
    return 1;
  }

  if (!process_command(args)) {
    out_ << "Invalid command. Type 'xfer help' for available commands." << std::endl;
    return 1;
  }
  return 0;
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::process_command(const std::vector<std::string>& args) {
  const std::string command = lowercase(args[0]);
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() - 1 << " argument(s)";

  if (command == "upload" && args.size() >= 2) {
    handle_upload_command(args[1]);
  }
  else if (command == "list") {
    handle_list_command();
  }
  else if (command == "download" && args.size() >= 2) {
    handle_download_command(args[1], args.size() >= 3 ? args[2] : ".");
  }
  else if (command == "delete" && args.size() >= 2) {
    handle_delete_command(args[1]);
  }
  else if (command == "config") {
    try {
      handle_config_command();
    } catch (const std::exception& e) {
      report_failure("updating configuration", e);
    }
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    return false;
  }
  return true;
}

void CLI::handle_upload_command(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    out_ << "Error: File " << path << " not found." << std::endl;
    return;
  }

  try {
    auto size = std::filesystem::file_size(path);
    out_ << "Uploading " << path << " (" << utils::format_kb(size) << ")..." << std::endl;

    auto result = transfer_client().upload(path);
    out_ << "✓ Success! File uploaded.\n"
         << "  File ID: " << result.id << '\n'
         << "  Size: " << utils::format_kb(result.size) << '\n';
    if (result.seconds > 0) {
      out_ << "  Transfer rate: " << one_decimal(size / 1024.0 / result.seconds) << " KB/s\n";
    }
    out_ << std::flush;
  } catch (const std::exception& e) {
    report_failure("during upload", e);
  }
}

void CLI::handle_list_command() {
  try {
    out_ << "Fetching file list from server..." << std::endl;
    auto files = transfer_client().list();
    if (files.empty()) {
      out_ << "No files found on server." << std::endl;
      return;
    }

    out_ << "\nFiles on server:\n" << TABLE_RULE << '\n'
         << std::left << std::setw(36) << "ID" << " | "
         << std::setw(30) << "Filename" << " | "
         << std::setw(10) << "Size" << " | "
         << "Uploaded" << '\n'
         << TABLE_RULE << '\n';
    for (const auto& file : files) {
      out_ << std::left << std::setw(36) << file.id << " | "
           << std::setw(30) << file.filename << " | "
           << std::setw(10) << utils::format_kb(file.size) << " | "
           << file.timestamp << '\n';
    }
    out_ << std::right << std::flush;
  } catch (const std::exception& e) {
    report_failure("listing files", e);
  }
}

void CLI::handle_download_command(const std::string& id, const std::string& dest) {
  try {
    out_ << "Downloading file with ID: " << id << "..." << std::endl;

    bool reported = false;
    auto progress = [this, &reported](std::uintmax_t received, std::optional<std::uintmax_t> total) {
      if (!total || *total == 0) {
        return;
      }
      double percent = static_cast<double>(received) * 100.0 / static_cast<double>(*total);
      out_ << "\rDownloading: " << one_decimal(percent) << "% ("
           << utils::format_kb(received) << " / " << utils::format_kb(*total) << ")" << std::flush;
      reported = true;
    };

    auto result = transfer_client().download(id, dest, progress);
    if (reported) {
      out_ << '\n';
    }
    out_ << "✓ File downloaded successfully to " << result.path.string() << '\n';
    if (result.seconds > 0) {
      out_ << "  Transfer rate: " << one_decimal(result.bytes / 1024.0 / result.seconds) << " KB/s\n";
    }
    out_ << std::flush;
  } catch (const std::exception& e) {
    out_ << '\n';
    report_failure("downloading file", e);
  }
}

void CLI::handle_delete_command(const std::string& id) {
  try {
    out_ << "Deleting file with ID: " << id << "..." << std::endl;
    transfer_client().remove(id);
    out_ << "✓ File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    report_failure("deleting file", e);
  }
}

void CLI::handle_config_command() {
  auto config = config_store_.reconfigure(in_, out_);
  client_ = std::make_unique<client::TransferClient>(config);
  out_ << "Updated configuration. Connected to: " << config.server_url << std::endl;
}

void CLI::handle_help_command() {
  out_ << "\nFile Transfer Client\n" << RULE << '\n'
       << "Commands:\n"
       << "  upload <filepath>              - Upload a file to the server\n"
       << "  list                           - List all files on the server\n"
       << "  download <file_id> [filepath]  - Download a file from the server\n"
       << "  delete <file_id>               - Delete a file from the server\n"
       << "  config                         - Update server URL and API key\n"
       << "  help                           - Show this help message\n"
       << "  exit                           - Exit the program\n"
       << RULE << std::endl;
}

void CLI::report_failure(const std::string& action, const std::exception& e) {
  BOOST_LOG_TRIVIAL(error) << "CLI: Error " << action << ": " << e.what();

  if (auto network = dynamic_cast<const client::NetworkError*>(&e); network && network->status() != 0) {
    out_ << "✗ Error: " << network->what() << '\n'
         << "  Status code: " << network->status() << std::endl;
    return;
  }
  out_ << "✗ Error " << action << ": " << e.what() << std::endl;
}

client::TransferClient& CLI::transfer_client() {
  if (!client_) {
    auto config = config_store_.load_or_prompt(in_, out_);
    client_ = std::make_unique<client::TransferClient>(config);
  }
  return *client_;
}

} // namespace cli
} // namespace xfer
