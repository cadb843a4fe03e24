#include "server/bootstrap.hpp"
#include <boost/log/trivial.hpp>

namespace xfer {
namespace server {

Bootstrap::Bootstrap(const ServerOptions& options)
    : options_(options) {

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing server for " << options_.host << ":" << options_.port;

    try {
        std::string secret = options_.api_key;
        if (secret.empty()) {
            secret = auth::CredentialGuard::generate_secret();
            BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: No API key configured, generated a new one";
        }
        guard_ = std::make_unique<auth::CredentialGuard>(std::move(secret));

        blob_store_ = std::make_unique<store::BlobStore>(options_.upload_dir);
        blob_store_->clear();
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Blob store ready at " << blob_store_->base_path().string();

        registry_ = std::make_unique<registry::FileRegistry>();

        handler_ = std::make_unique<transfer::TransferHandler>(*guard_, *registry_, *blob_store_,
                                                               options_.max_upload_bytes());
        router_ = std::make_unique<network::Router>(*handler_);

        http_server_ = std::make_unique<network::HttpServer>(options_.host, options_.port, *router_,
                                                             options_.max_upload_bytes());

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
        throw;
    }
}

bool Bootstrap::start() {
    if (!http_server_) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Server already shut down";
        return false;
    }
    if (!http_server_->start_listener()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start HTTP server";
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Serving uploads from " << options_.upload_dir
                            << " on port " << http_server_->local_port();
    return true;
}

bool Bootstrap::shutdown() {
    try {
        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

        // Stop serving before tearing down what the sessions use
        if (http_server_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down HTTP server with "
                                     << http_server_->active_sessions() << " open session(s)";
            http_server_->shutdown();
            http_server_.reset();
        }

        router_.reset();
        handler_.reset();
        registry_.reset();
        blob_store_.reset();

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during shutdown: " << e.what();
        return false;
    }
}

Bootstrap::~Bootstrap() {
    if (!shutdown()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to shutdown cleanly in destructor";
    }
}

} // namespace server
} // namespace xfer
