#ifndef DOCREG_LOGGER_HPP
#define DOCREG_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace docreg::logging {

using severity = boost::log::trivial::severity_level;

// Initialize logging to a text file sink with timestamped records
void init_logging(const std::string& log_file = "docreg.log",
                  severity min_level = severity::info);

// Initialize logging to the console, used by the shell in verbose mode and by tests
void init_console_logging(severity min_level = severity::debug);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"; defaults to info
severity parse_severity(const std::string& name);

void set_log_level(severity min_level);
void enable_logging();
void disable_logging();

} // namespace docreg::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // DOCREG_LOGGER_HPP
