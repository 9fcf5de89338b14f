#include "logger/logger.hpp"
#include "errors/errors.hpp"
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace chunkcache::logging {

namespace {

namespace blog = boost::log;
namespace expr = boost::log::expressions;

// Shared record layout for file and console sinks
auto log_format() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << blog::trivial::severity << "]"
    << " [Thread " << expr::attr<blog::attributes::current_thread_id::value_type>("ThreadID") << "] "
    << expr::smessage;
}

} // namespace

const char* to_string(severity_level level) {
  switch (level) {
    case severity_level::trace:   return "TRACE";
    case severity_level::debug:   return "DEBUG";
    case severity_level::info:    return "INFO";
    case severity_level::warning: return "WARNING";
    case severity_level::error:   return "ERROR";
    case severity_level::fatal:   return "FATAL";
    default:                      return "UNKNOWN";
  }
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace") return severity_level::trace;
  if (name == "debug") return severity_level::debug;
  if (name == "info") return severity_level::info;
  if (name == "warning") return severity_level::warning;
  if (name == "error") return severity_level::error;
  if (name == "fatal") return severity_level::fatal;
  throw errors::InvalidArgumentError("unknown log level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    blog::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<blog::sinks::text_file_backend>();

    // Convert to absolute path so a later chdir does not move the log
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = blog::sinks::synchronous_sink<blog::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(log_format());

    blog::core::get()->add_sink(sink);
    blog::add_common_attributes();

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  blog::core::get()->remove_all_sinks();

  blog::add_console_log(
    std::clog,
    blog::keywords::format = log_format(),
    blog::keywords::auto_flush = true
  );
  blog::add_common_attributes();

  set_log_level(min_level);
  enable_logging();
}

void set_log_level(severity_level min_level) {
  blog::core::get()->set_filter(blog::trivial::severity >= min_level);
}

void enable_logging() {
  blog::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  blog::core::get()->set_logging_enabled(false);
}

} // namespace chunkcache::logging
