#ifndef NETCP_LOGGER_LOGGER_HPP
#define NETCP_LOGGER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace netcp {
namespace logger {

struct LogOptions {
  // Empty: log to standard error
  std::string log_file;
  boost::log::trivial::severity_level min_level{boost::log::trivial::fatal};
};

// Replaces all sinks with a single file or console sink filtered at min_level
void init_logging(const LogOptions& options = LogOptions{});

// Parses trace|debug|info|warning|error|fatal. Throws std::invalid_argument otherwise.
boost::log::trivial::severity_level parse_severity(const std::string& text);

} // namespace logger
} // namespace netcp

#endif // NETCP_LOGGER_LOGGER_HPP
