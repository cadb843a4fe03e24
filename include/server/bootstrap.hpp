#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "auth/credential_guard.hpp"
#include "network/http_server.hpp"
#include "network/router.hpp"
#include "registry/file_registry.hpp"
#include "server/server_options.hpp"
#include "store/blob_store.hpp"
#include "transfer/transfer_handler.hpp"

namespace xfer {
namespace server {

class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Wires every component; blobs left in the upload directory by an earlier
  // process are removed since the registry does not outlive the process
  explicit Bootstrap(const ServerOptions& options);
  ~Bootstrap();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  bool start();
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  uint16_t port() const { return http_server_ ? http_server_->local_port() : options_.port; }
  const std::string& api_key() const { return guard_->secret(); }
  const ServerOptions& options() const { return options_; }
  registry::FileRegistry& get_registry() { return *registry_; }
  store::BlobStore& get_blob_store() { return *blob_store_; }
  transfer::TransferHandler& get_transfer_handler() { return *handler_; }
  network::HttpServer& get_http_server() { return *http_server_; }

private:
  // ---- PARAMETERS ----
  ServerOptions options_;

  // System components
  std::unique_ptr<auth::CredentialGuard> guard_;
  std::unique_ptr<store::BlobStore> blob_store_;
  std::unique_ptr<registry::FileRegistry> registry_;
  std::unique_ptr<transfer::TransferHandler> handler_;
  std::unique_ptr<network::Router> router_;
  std::unique_ptr<network::HttpServer> http_server_;
};

} // namespace server
} // namespace xfer
