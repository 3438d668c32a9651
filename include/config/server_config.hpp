#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include "logger/logger.hpp"
#include "store/paste_store.hpp"

namespace pastebin {
namespace config {

struct ServerConfig {
  // Network parameters
  std::string address{"127.0.0.1"};
  uint16_t port{8820};
  std::size_t threads{0};  // 0 = hardware concurrency

  // Store parameters
  std::size_t max_paste_size{32 * 1024};
  std::size_t device_paste_limit{store::PasteStore::DEFAULT_DEVICE_PASTE_LIMIT};

  // Logging
  std::string log_file;
  logging::severity_level log_level{logging::severity_level::info};

  bool show_help{false};
  bool valid{false};
};

// Number of worker threads the server will run for this config
std::size_t effective_threads(const ServerConfig& config);

void print_usage(const std::string& program_name, std::ostream& out);

// Parses argv; on error prints the reason and usage to std::cerr and
// returns a config with valid == false
ServerConfig parse_command_line(int argc, const char* const argv[]);

} // namespace config
} // namespace pastebin
