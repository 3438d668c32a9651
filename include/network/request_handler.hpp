#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <boost/beast/http.hpp>
#include "keygen/device_code.hpp"
#include "keygen/id_generator.hpp"
#include "network/http_error.hpp"
#include "store/paste_store.hpp"

namespace pastebin {
namespace network {

// Maps HTTP requests onto the paste store. Safe to call from many threads.
class RequestHandler {
public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;
  using IdSource = std::function<std::string()>;

  static constexpr const char* DEVICE_CODE_HEADER = "Device-Code";
  // Fresh ids tried before a submission fails with 500
  static constexpr std::size_t MAX_INSERT_ATTEMPTS = 8;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RequestHandler(store::PasteStore& store, std::size_t max_paste_size,
                 keygen::RandomSource& random_source = keygen::default_random_source(),
                 IdSource id_source = &keygen::generate_id);

  RequestHandler(const RequestHandler&) = delete;
  RequestHandler& operator=(const RequestHandler&) = delete;


  // ---- REQUEST PROCESSING ----
  Response handle(const Request& request);

  // JSON error body {"error": ..., "status": ...}
  static Response error_response(HttpError error, unsigned version, bool keep_alive);


  // ---- GETTERS ----
  std::size_t max_paste_size() const { return max_paste_size_; }

private:
  // ---- PARAMETERS ----
  store::PasteStore& store_;
  const std::size_t max_paste_size_;
  keygen::DeviceCodeGenerator device_codes_;
  IdSource id_source_;


  // ---- ROUTES ----
  Response index(const Request& request) const;
  Response issue_device_code(const Request& request);
  Response list_all_pastes(const Request& request) const;
  Response submit(const Request& request);
  Response submit_raw(const Request& request);
  Response show_paste(const Request& request, std::string_view key) const;
  Response unknown_resource(const Request& request) const;


  // ---- REQUEST HELPERS ----
  // Valid Device-Code header value, if any
  static std::optional<std::string> extract_device_code(const Request& request);
  // Stores content under a fresh id, regenerating the id on collision
  std::optional<std::string> store_new_paste(store::Bytes content, const std::string& device_code);
};

// Decoded value of field in an application/x-www-form-urlencoded body.
// Absent when the field is missing or the body is not valid form encoding.
std::optional<std::string> form_value(std::string_view body, std::string_view field);

} // namespace network
} // namespace pastebin
