#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace docreg::logging {

void init_logging(const std::string& log_file, severity min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    // Convert to absolute path
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);

    namespace expr = boost::log::expressions;
    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage
    );

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity min_level) {
  // Remove any existing sinks to prevent duplicates
  boost::log::core::get()->remove_all_sinks();

  boost::log::register_simple_formatter_factory<severity, char>("Severity");
  boost::log::add_console_log(
    std::clog,
    boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
    boost::log::keywords::auto_flush = true
  );

  boost::log::add_common_attributes();
  set_log_level(min_level);
  enable_logging();
}

severity parse_severity(const std::string& name) {
  if (name == "trace") return severity::trace;
  if (name == "debug") return severity::debug;
  if (name == "info") return severity::info;
  if (name == "warning" || name == "warn") return severity::warning;
  if (name == "error") return severity::error;
  if (name == "fatal") return severity::fatal;
  return severity::info;
}

void set_log_level(severity min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

} // namespace docreg::logging
