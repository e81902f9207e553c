#include "logger/logger.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace netcp {
namespace logger {

namespace {

namespace expr = boost::log::expressions;

// Common record layout for every sink
template <typename Sink>
void set_format(Sink& sink) {
  sink.set_formatter(
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage
  );
}

} // namespace

void init_logging(const LogOptions& options) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    if (!options.log_file.empty()) {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<file_sink>(backend);
      set_format(*sink);
      boost::log::core::get()->add_sink(sink);
    } else {
      auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(backend);
      set_format(*sink);
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= options.min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

boost::log::trivial::severity_level parse_severity(const std::string& text) {
  boost::log::trivial::severity_level level;
  if (!boost::log::trivial::from_string(text.c_str(), text.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + text);
  }
  return level;
}

} // namespace logger
} // namespace netcp
