#include "config/server_config.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>
#include <boost/asio/ip/address.hpp>
#include <boost/system/system_error.hpp>

namespace pastebin {
namespace config {

namespace {

bool parse_number(const std::string& value, std::size_t& out) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  try {
    unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<std::size_t>::max()) {
      return false;
    }
    out = static_cast<std::size_t>(parsed);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

// Accepts "<address>:<port>"; the address must be a literal IPv4 or IPv6 address
bool parse_bind_address(const std::string& value, ServerConfig& config) {
  const std::size_t colon_pos = value.rfind(':');
  if (colon_pos == std::string::npos || colon_pos == 0) {
    return false;
  }

  std::string address = value.substr(0, colon_pos);
  if (address.size() > 2 && address.front() == '[' && address.back() == ']') {
    address = address.substr(1, address.size() - 2);
  }

  std::size_t port = 0;
  if (!parse_number(value.substr(colon_pos + 1), port) || port > std::numeric_limits<uint16_t>::max()) {
    return false;
  }

  boost::system::error_code ec;
  boost::asio::ip::make_address(address, ec);
  if (ec) {
    return false;
  }

  config.address = address;
  config.port = static_cast<uint16_t>(port);
  return true;
}

ServerConfig fail(const std::string& program_name, const std::string& message) {
  std::cerr << "Error: " << message << '\n';
  print_usage(program_name, std::cerr);
  return ServerConfig{};
}

} // namespace

std::size_t effective_threads(const ServerConfig& config) {
  if (config.threads != 0) {
    return config.threads;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [<address>:<port>] [options]\n"
      << "Positional arguments:\n"
      << "  <address>:<port>          Socket address to bind to (default: 127.0.0.1:8820)\n"
      << "Options:\n"
      << "  --max-paste-size <bytes>  Maximum paste size in bytes (default: 32768)\n"
      << "  --device-limit <n>        Pastes kept per device before the oldest is evicted (default: 2)\n"
      << "  --threads <n>             Worker threads (default: hardware concurrency)\n"
      << "  --log-file <path>         Write logs to <path> instead of the console\n"
      << "  --log-level <level>       trace, debug, info, warning, error or fatal (default: info)\n"
      << "  --help                    Display this help message\n"
      << "Example: " << program_name << " 0.0.0.0:8000 --max-paste-size 65536\n";
}

ServerConfig parse_command_line(int argc, const char* const argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "pastebin";

  ServerConfig config;
  bool have_bind_address = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }

    if (arg.rfind("--", 0) != 0) {
      if (have_bind_address) {
        return fail(program_name, "Unexpected argument: " + arg);
      }
      if (!parse_bind_address(arg, config)) {
        return fail(program_name, "Invalid socket address: " + arg);
      }
      have_bind_address = true;
      continue;
    }

    if (i + 1 >= argc) {
      return fail(program_name, "Missing value for " + arg);
    }
    const std::string value(argv[++i]);

    if (arg == "--max-paste-size") {
      if (!parse_number(value, config.max_paste_size) || config.max_paste_size == 0) {
        return fail(program_name, "Invalid paste size: " + value);
      }
    } else if (arg == "--device-limit") {
      if (!parse_number(value, config.device_paste_limit) || config.device_paste_limit == 0) {
        return fail(program_name, "Invalid device limit: " + value);
      }
    } else if (arg == "--threads") {
      if (!parse_number(value, config.threads) || config.threads == 0) {
        return fail(program_name, "Invalid thread count: " + value);
      }
    } else if (arg == "--log-file") {
      config.log_file = value;
    } else if (arg == "--log-level") {
      if (!logging::parse_severity(value, config.log_level)) {
        return fail(program_name, "Invalid log level: " + value);
      }
    } else {
      return fail(program_name, "Unknown argument: " + arg);
    }
  }

  config.valid = true;
  return config;
}

} // namespace config
} // namespace pastebin
