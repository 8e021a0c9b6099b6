#ifndef GRIDSTORE_LOGGER_HPP
#define GRIDSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gridstore::logger {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a file sink, every record is flushed immediately
void init_logging(const std::string& log_file = "gridstore.log",
                  severity_level min_level = boost::log::trivial::info);
// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// Adjusts the minimum severity of the global filter
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument on anything else.
severity_level parse_severity(const std::string& name);

} // namespace gridstore::logger

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // GRIDSTORE_LOGGER_HPP
