#ifndef PASTEBIN_LOGGER_HPP
#define PASTEBIN_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace pastebin::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs the single process-wide sink. An empty log_file logs to the console
// (std::clog); otherwise records are appended to log_file.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity of the installed filter
void set_log_level(severity_level min_level);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a level
bool parse_severity(const std::string& name, severity_level& level);

} // namespace pastebin::logging

#endif // PASTEBIN_LOGGER_HPP
