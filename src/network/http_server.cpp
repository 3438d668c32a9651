#include "network/http_server.hpp"
#include "http_session.hpp"

namespace pastebin {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler,
                       std::size_t threads)
  : port_(port)
  , address_(address)
  , thread_count_(threads == 0 ? 1 : threads)
  , is_running_(false)
  , bound_port_(0)
  , handler_(handler) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port
                          << " with " << thread_count_ << " worker thread(s)";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    // A stopped io_context must be restarted before it runs again
    io_context_.restart();

    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting IO context";
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_threads_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back(&HttpServer::run_io_context, this);
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on http://" << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own strand
  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        boost::system::error_code endpoint_ec;
        auto remote = socket.remote_endpoint(endpoint_ec);
        if (!endpoint_ec) {
          BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from " << remote;
        }
        std::make_shared<HttpSession>(std::move(socket), handler_)->start();
      } else if (error == boost::asio::error::operation_aborted) {
        return;  // Acceptor closed by shutdown
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::run_io_context() {
  try {
    io_context_.run();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
  }
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context; open sessions are abandoned
  work_guard_.reset();
  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::port() const {
  return bound_port_;
}

} // namespace network
} // namespace pastebin
