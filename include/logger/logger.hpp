#ifndef CHUNKCACHE_LOGGER_HPP
#define CHUNKCACHE_LOGGER_HPP

#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>

namespace chunkcache::logging {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

// Replaces every sink with a text file sink writing to log_file
void init_logging(const std::string& log_file = "chunkcache.log",
                  severity_level min_level = severity_level::info);

// Replaces every sink with a console sink, used by the interactive shell and tests
void init_console_logging(severity_level min_level = severity_level::warning);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace chunkcache::logging

#endif // CHUNKCACHE_LOGGER_HPP
