#include "network/request_handler.hpp"
#include <boost/beast/core/string.hpp>
#include <boost/log/trivial.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/parse_query.hpp>
#include <nlohmann/json.hpp>
#include <utility>

namespace pastebin {
namespace network {

namespace http = boost::beast::http;

namespace {

constexpr const char* SERVER_NAME = "pastebin";
constexpr const char* FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

std::string_view to_std(boost::beast::string_view view) {
  return std::string_view(view.data(), view.size());
}

RequestHandler::Response make_response(http::status status, unsigned version, bool keep_alive,
                                       const std::string& content_type, std::string body) {
  RequestHandler::Response response{status, version};
  response.set(http::field::server, SERVER_NAME);
  if (!content_type.empty()) {
    response.set(http::field::content_type, content_type);
  }
  response.keep_alive(keep_alive);
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

RequestHandler::Response json_response(const RequestHandler::Request& request, const nlohmann::json& body) {
  return make_response(http::status::ok, request.version(), request.keep_alive(),
                       "application/json", body.dump());
}

// Media type of a Content-Type value, without parameters or surrounding blanks
std::string_view media_type(std::string_view content_type) {
  std::string_view type = content_type.substr(0, content_type.find(';'));
  const std::size_t first = type.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = type.find_last_not_of(" \t");
  return type.substr(first, last - first + 1);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::PasteStore& store, std::size_t max_paste_size,
                               keygen::RandomSource& random_source, IdSource id_source)
  : store_(store)
  , max_paste_size_(max_paste_size)
  , device_codes_(random_source)
  , id_source_(std::move(id_source)) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: Initialized with max paste size: " << max_paste_size_ << " bytes";
}


//==============================================
// REQUEST PROCESSING
//==============================================

RequestHandler::Response RequestHandler::handle(const Request& request) {
  std::string_view target = to_std(request.target());
  std::string_view path = target.substr(0, target.find('?'));
  const http::verb method = request.method();

  BOOST_LOG_TRIVIAL(debug) << "Request handler: " << request.method_string() << " " << target;

  try {
    if (path == "/") {
      switch (method) {
        case http::verb::get:  return index(request);
        case http::verb::post: return submit(request);
        case http::verb::put:  return submit_raw(request);
        case http::verb::head:
          return error_response(HttpError::METHOD_NOT_ALLOWED, request.version(), request.keep_alive());
        default:
          return unknown_resource(request);
      }
    }

    if (method == http::verb::get && path == "/all") {
      return list_all_pastes(request);
    }
    if (method == http::verb::get && path == "/device") {
      return issue_device_code(request);
    }

    // Single path segment: /{paste}
    std::string_view key = path.substr(1);
    if (!key.empty() && key.find('/') == std::string_view::npos) {
      if (method == http::verb::get) {
        return show_paste(request, key);
      }
      if (method == http::verb::head) {
        return error_response(HttpError::METHOD_NOT_ALLOWED, request.version(), request.keep_alive());
      }
    }

    return unknown_resource(request);
  }
  catch (const keygen::KeygenError& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Key generation failed: " << e.what();
    return error_response(HttpError::INTERNAL_SERVER_ERROR, request.version(), request.keep_alive());
  }
}

RequestHandler::Response RequestHandler::error_response(HttpError error, unsigned version, bool keep_alive) {
  nlohmann::json body = {
    {"error", http_error_to_string(error)},
    {"status", static_cast<unsigned>(http_error_to_status(error))}
  };
  return make_response(http_error_to_status(error), version, keep_alive, "application/json", body.dump());
}


//==============================================
// ROUTES
//==============================================

RequestHandler::Response RequestHandler::index(const Request& request) const {
  auto endpoint = [](const char* method, const char* path, const char* description) {
    return nlohmann::json{{"method", method}, {"path", path}, {"description", description}};
  };

  nlohmann::json body = {
    {"message", "Bin API - A pastebin service"},
    {"endpoints", {
      endpoint("GET", "/", "Get API information"),
      endpoint("GET", "/device", "Get a new device code"),
      endpoint("POST", "/", "Create a new paste (form data)"),
      endpoint("PUT", "/", "Create a new paste (raw data)"),
      endpoint("GET", "/all", "Get all paste IDs for the device"),
      endpoint("GET", "/{paste}", "Get paste content by ID")
    }}
  };
  return json_response(request, body);
}

RequestHandler::Response RequestHandler::issue_device_code(const Request& request) {
  std::string device_code = device_codes_.generate_unique(store_);
  BOOST_LOG_TRIVIAL(info) << "Request handler: Issued device code: " << device_code;
  return json_response(request, nlohmann::json{{"device_code", device_code}});
}

RequestHandler::Response RequestHandler::list_all_pastes(const Request& request) const {
  auto device_code = extract_device_code(request);
  if (!device_code) {
    return error_response(HttpError::UNAUTHORIZED, request.version(), request.keep_alive());
  }

  nlohmann::json body = store_.list_ids(*device_code);
  return json_response(request, body);
}

RequestHandler::Response RequestHandler::submit(const Request& request) {
  auto device_code = extract_device_code(request);
  if (!device_code) {
    return error_response(HttpError::UNAUTHORIZED, request.version(), request.keep_alive());
  }
  if (request.body().size() > max_paste_size_) {
    return error_response(HttpError::PAYLOAD_TOO_LARGE, request.version(), request.keep_alive());
  }

  std::string_view content_type = to_std(request[http::field::content_type]);
  const std::string_view type = media_type(content_type);
  if (!boost::beast::iequals(boost::beast::string_view(type.data(), type.size()), FORM_CONTENT_TYPE)) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Form submission with content type: " << content_type;
    return error_response(HttpError::BAD_REQUEST, request.version(), request.keep_alive());
  }

  auto value = form_value(request.body(), "val");
  if (!value) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Form submission without a valid 'val' field";
    return error_response(HttpError::BAD_REQUEST, request.version(), request.keep_alive());
  }

  auto id = store_new_paste(store::Bytes(value->begin(), value->end()), *device_code);
  if (!id) {
    return error_response(HttpError::INTERNAL_SERVER_ERROR, request.version(), request.keep_alive());
  }

  Response response = make_response(http::status::found, request.version(), request.keep_alive(), "", "");
  response.set(http::field::location, "/" + *id);
  return response;
}

RequestHandler::Response RequestHandler::submit_raw(const Request& request) {
  auto device_code = extract_device_code(request);
  if (!device_code) {
    return error_response(HttpError::UNAUTHORIZED, request.version(), request.keep_alive());
  }
  if (request.body().size() > max_paste_size_) {
    return error_response(HttpError::PAYLOAD_TOO_LARGE, request.version(), request.keep_alive());
  }

  const std::string& body = request.body();
  auto id = store_new_paste(store::Bytes(body.begin(), body.end()), *device_code);
  if (!id) {
    return error_response(HttpError::INTERNAL_SERVER_ERROR, request.version(), request.keep_alive());
  }

  std::string_view host = to_std(request[http::field::host]);
  std::string uri = host.empty() ? "/" + *id + "\n"
                                 : "https://" + std::string(host) + "/" + *id + "\n";
  return make_response(http::status::ok, request.version(), request.keep_alive(),
                       "text/plain; charset=utf-8", std::move(uri));
}

RequestHandler::Response RequestHandler::show_paste(const Request& request, std::string_view key) const {
  auto device_code = extract_device_code(request);
  if (!device_code) {
    return error_response(HttpError::UNAUTHORIZED, request.version(), request.keep_alive());
  }

  // Extension only matters for rendering
  std::string id(key.substr(0, key.find('.')));

  auto content = store_.lookup(id, *device_code);
  if (!content) {
    return error_response(HttpError::NOT_FOUND, request.version(), request.keep_alive());
  }

  return make_response(http::status::ok, request.version(), request.keep_alive(),
                       "text/plain; charset=utf-8", std::string(content->begin(), content->end()));
}

RequestHandler::Response RequestHandler::unknown_resource(const Request& request) const {
  BOOST_LOG_TRIVIAL(error) << "Request handler: Couldn't find resource " << request.method_string()
                           << " " << request.target();
  return error_response(HttpError::NOT_FOUND, request.version(), request.keep_alive());
}


//==============================================
// REQUEST HELPERS
//==============================================

std::optional<std::string> RequestHandler::extract_device_code(const Request& request) {
  auto field = request.find(DEVICE_CODE_HEADER);
  if (field == request.end()) {
    return std::nullopt;
  }

  std::string_view value = to_std(field->value());
  if (!keygen::is_valid_device_code(value)) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: Rejecting malformed device code";
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<std::string> RequestHandler::store_new_paste(store::Bytes content, const std::string& device_code) {
  for (std::size_t attempt = 0; attempt < MAX_INSERT_ATTEMPTS; ++attempt) {
    std::string id = id_source_();
    if (store_.try_insert(id, content, device_code)) {
      return id;
    }
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Id collision on " << id << ", regenerating";
  }

  BOOST_LOG_TRIVIAL(error) << "Request handler: No free id after " << MAX_INSERT_ATTEMPTS << " attempts";
  return std::nullopt;
}

std::optional<std::string> form_value(std::string_view body, std::string_view field) {
  auto params = boost::urls::parse_query(boost::core::string_view(body.data(), body.size()));
  if (!params) {
    BOOST_LOG_TRIVIAL(debug) << "Request handler: Malformed form body: " << params.error().message();
    return std::nullopt;
  }

  boost::urls::encoding_opts form_encoding;
  form_encoding.space_as_plus = true;

  for (auto param : *params) {
    if (param.key.decode(form_encoding) != field) {
      continue;
    }
    return param.has_value ? param.value.decode(form_encoding) : std::string();
  }
  return std::nullopt;
}

} // namespace network
} // namespace pastebin
