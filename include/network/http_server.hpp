#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "network/request_handler.hpp"

namespace pastebin {
namespace network {

class HttpServer {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler,
             std::size_t threads = 1);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Port actually bound; differs from the configured one when that was 0
  uint16_t port() const;

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  const std::size_t thread_count_;

  // Server state
  std::vector<std::thread> io_threads_;
  std::atomic<bool> is_running_;
  uint16_t bound_port_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  RequestHandler& handler_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void run_io_context();
};

} // namespace network
} // namespace pastebin
