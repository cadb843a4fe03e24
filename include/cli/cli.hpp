#pragma once

#include <exception>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "client/client_config.hpp"
#include "client/transfer_client.hpp"

namespace xfer {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::ConfigStore& config_store, std::istream& in, std::ostream& out);


    // ---- STARTUP ----
    // Interactive loop until exit/quit or end of input
    void run();
    // Runs one command given as arguments, returns the process exit code
    int run_command(const std::vector<std::string>& args);

private:
    // ---- PARAMETERS ----
    bool running_;
    std::istream& in_;
    std::ostream& out_;
    // System components
    client::ConfigStore& config_store_;
    std::unique_ptr<client::TransferClient> client_;


    // ---- COMMAND PROCESSING ----
    // Returns false when the arguments match no command
    bool process_command(const std::vector<std::string>& args);
    void handle_upload_command(const std::string& path);
    void handle_list_command();
    void handle_download_command(const std::string& id, const std::string& dest);
    void handle_delete_command(const std::string& id);
    void handle_config_command();
    void handle_help_command();
    void report_failure(const std::string& action, const std::exception& e);

    // Loads or prompts for the config and builds the client on first use
    client::TransferClient& transfer_client();
};

// Splits a command line on whitespace
std::vector<std::string> split_arguments(const std::string& line);

} // namespace cli
} // namespace xfer
