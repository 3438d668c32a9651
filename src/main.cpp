#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include "server/pastebin_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>

bool run_server(const pastebin::config::ServerConfig& config) {
  try {
    pastebin::server::PastebinServer server(config);

    if (!server.start()) {
      std::cerr << "Error: Failed to start server on " << config.address << ":" << config.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", stopping";
      }
    });
    signal_context.run();

    return server.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto config = pastebin::config::parse_command_line(argc, argv);
  if (!config.valid) {
    return 1;
  }
  if (config.show_help) {
    pastebin::config::print_usage(argv[0], std::cout);
    return 0;
  }

  try {
    pastebin::logging::init_logging(config.log_file, config.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_server(config) ? 0 : 1;
}
