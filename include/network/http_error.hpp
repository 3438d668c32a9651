#ifndef PASTEBIN_NETWORK_HTTP_ERROR_HPP
#define PASTEBIN_NETWORK_HTTP_ERROR_HPP

#include <boost/beast/http/status.hpp>

namespace pastebin {
namespace network {

enum class HttpError {
    BAD_REQUEST,
    UNAUTHORIZED,
    NOT_FOUND,
    METHOD_NOT_ALLOWED,
    PAYLOAD_TOO_LARGE,
    INTERNAL_SERVER_ERROR
};

inline const char* http_error_to_string(HttpError error) {
    switch (error) {
        case HttpError::BAD_REQUEST: return "Bad Request";
        case HttpError::UNAUTHORIZED: return "Unauthorized";
        case HttpError::NOT_FOUND: return "Not Found";
        case HttpError::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpError::PAYLOAD_TOO_LARGE: return "Payload Too Large";
        case HttpError::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        default: return "Undefined error";
    }
}

inline boost::beast::http::status http_error_to_status(HttpError error) {
    using boost::beast::http::status;
    switch (error) {
        case HttpError::BAD_REQUEST: return status::bad_request;
        case HttpError::UNAUTHORIZED: return status::unauthorized;
        case HttpError::NOT_FOUND: return status::not_found;
        case HttpError::METHOD_NOT_ALLOWED: return status::method_not_allowed;
        case HttpError::PAYLOAD_TOO_LARGE: return status::payload_too_large;
        case HttpError::INTERNAL_SERVER_ERROR: return status::internal_server_error;
        default: return status::internal_server_error;
    }
}

} // namespace network
} // namespace pastebin

#endif // PASTEBIN_NETWORK_HTTP_ERROR_HPP
