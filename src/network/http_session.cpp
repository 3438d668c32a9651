#include "http_session.hpp"
#include <boost/log/trivial.hpp>

namespace pastebin {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpSession::HttpSession(boost::asio::ip::tcp::socket&& socket, RequestHandler& handler)
  : stream_(std::move(socket))
  , handler_(handler) {
}


//==============================================
// SESSION CONTROL
//==============================================

void HttpSession::start() {
  // All handlers of this session run on the connection's strand
  boost::asio::dispatch(stream_.get_executor(),
    beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}


//==============================================
// INCOMING REQUEST PROCESSING
//==============================================

void HttpSession::do_read() {
  // Fresh parser per request so the body limit applies to each one
  parser_.emplace();
  parser_->body_limit(handler_.max_paste_size());

  stream_.expires_after(IDLE_TIMEOUT);

  http::async_read(stream_, buffer_, *parser_,
    beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
  if (ec == http::error::end_of_stream) {
    do_close();
    return;
  }

  if (ec == http::error::body_limit) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Request body exceeds " << handler_.max_paste_size() << " bytes";
    const auto& header = parser_->get();
    send_response(RequestHandler::error_response(HttpError::PAYLOAD_TOO_LARGE, header.version(), false));
    return;
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      BOOST_LOG_TRIVIAL(error) << "HTTP session: Read error: " << ec.message();
    }
    do_close();
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Read request of " << bytes_transferred << " bytes";

  RequestHandler::Request request = parser_->release();
  try {
    send_response(handler_.handle(request));
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Request handling failed: " << e.what();
    send_response(RequestHandler::error_response(HttpError::INTERNAL_SERVER_ERROR, request.version(), false));
  }
}


//==============================================
// OUTGOING RESPONSE PROCESSING
//==============================================

void HttpSession::send_response(RequestHandler::Response&& response) {
  const bool keep_alive = response.keep_alive();

  // The response must outlive the asynchronous write
  response_ = std::make_shared<RequestHandler::Response>(std::move(response));

  http::async_write(stream_, *response_,
    beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), keep_alive));
}

void HttpSession::on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
  response_.reset();

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Write error: " << ec.message();
    do_close();
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Wrote " << bytes_transferred << " bytes";

  if (!keep_alive) {
    do_close();
    return;
  }

  do_read();
}


//==============================================
// TEARDOWN
//==============================================

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Shutdown error: " << ec.message();
  }
}

} // namespace network
} // namespace pastebin
