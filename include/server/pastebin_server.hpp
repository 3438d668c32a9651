#pragma once

#include <atomic>
#include <memory>
#include "config/server_config.hpp"
#include "network/http_server.hpp"
#include "network/request_handler.hpp"
#include "store/paste_store.hpp"

namespace pastebin {
namespace server {

// Builds and owns the paste store, request handler and HTTP server
class PastebinServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PastebinServer(const config::ServerConfig& config);
  ~PastebinServer();

  PastebinServer(const PastebinServer&) = delete;
  PastebinServer& operator=(const PastebinServer&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  bool start();
  // Stops serving. Does nothing unless the server is running.
  bool shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  store::PasteStore& get_store() { return *store_; }
  network::HttpServer& get_http_server() { return *http_server_; }

private:
  // ---- PARAMETERS ----
  config::ServerConfig config_;
  std::atomic<bool> is_running_{false};

  // System components
  std::unique_ptr<store::PasteStore> store_;
  std::unique_ptr<network::RequestHandler> handler_;
  std::unique_ptr<network::HttpServer> http_server_;
};

} // namespace server
} // namespace pastebin
