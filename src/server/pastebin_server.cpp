#include "server/pastebin_server.hpp"
#include <boost/log/trivial.hpp>

namespace pastebin {
namespace server {

PastebinServer::PastebinServer(const config::ServerConfig& config)
    : config_(config) {

    BOOST_LOG_TRIVIAL(info) << "Pastebin server: Initializing components";

    try {
        // Store first, everything else reads from it
        store_ = std::make_unique<store::PasteStore>(config_.device_paste_limit);
        BOOST_LOG_TRIVIAL(debug) << "Pastebin server: Paste store created successfully";

        handler_ = std::make_unique<network::RequestHandler>(*store_, config_.max_paste_size);
        BOOST_LOG_TRIVIAL(debug) << "Pastebin server: Request handler created successfully";

        http_server_ = std::make_unique<network::HttpServer>(
            config_.port, config_.address, *handler_, config::effective_threads(config_));
        BOOST_LOG_TRIVIAL(debug) << "Pastebin server: HTTP server created successfully";

        BOOST_LOG_TRIVIAL(info) << "Pastebin server: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Pastebin server: Failed to initialize components: " << e.what();
        throw;
    }
}

bool PastebinServer::start() {
    if (!http_server_ || !http_server_->start_listener()) {
        BOOST_LOG_TRIVIAL(error) << "Pastebin server: Failed to start HTTP server";
        return false;
    }
    is_running_ = true;

    BOOST_LOG_TRIVIAL(info) << "Pastebin server: Listening on http://" << config_.address << ":"
                            << http_server_->port();
    return true;
}

bool PastebinServer::shutdown() {
    if (!is_running_.exchange(false)) {
        return true;
    }

    try {
        BOOST_LOG_TRIVIAL(info) << "Pastebin server: Initiating shutdown sequence";

        // The HTTP server goes first so that no request still uses the handler
        if (http_server_) {
            BOOST_LOG_TRIVIAL(debug) << "Pastebin server: Shutting down HTTP server";
            http_server_->shutdown();
        }

        BOOST_LOG_TRIVIAL(info) << "Pastebin server: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Pastebin server: Error during shutdown: " << e.what();
        return false;
    }
}

PastebinServer::~PastebinServer() {
    if (!shutdown()) {
        BOOST_LOG_TRIVIAL(error) << "Pastebin server: Failed to shutdown cleanly in destructor";
    }
}

} // namespace server
} // namespace pastebin
