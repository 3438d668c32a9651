#ifndef PASTEBIN_NETWORK_HTTP_SESSION_HPP
#define PASTEBIN_NETWORK_HTTP_SESSION_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "network/request_handler.hpp"

namespace pastebin {
namespace network {

// One accepted connection. Reads requests, hands them to the RequestHandler
// and writes the responses back until the peer or keep-alive ends it.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  static constexpr std::chrono::seconds IDLE_TIMEOUT{30};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpSession(boost::asio::ip::tcp::socket&& socket, RequestHandler& handler);

  HttpSession(const HttpSession&) = delete;
  HttpSession& operator=(const HttpSession&) = delete;


  // ---- SESSION CONTROL ----
  void start();

private:
  // ---- PARAMETERS ----
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  std::shared_ptr<RequestHandler::Response> response_;
  RequestHandler& handler_;


  // ---- INCOMING REQUEST PROCESSING ----
  void do_read();
  void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);


  // ---- OUTGOING RESPONSE PROCESSING ----
  void send_response(RequestHandler::Response&& response);
  void on_write(bool keep_alive, boost::beast::error_code ec, std::size_t bytes_transferred);


  // ---- TEARDOWN ----
  void do_close();
};

} // namespace network
} // namespace pastebin

#endif // PASTEBIN_NETWORK_HTTP_SESSION_HPP
