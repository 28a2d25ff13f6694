#ifndef RANDOMFS_LOGGER_HPP
#define RANDOMFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace randomfs::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a synchronous text file sink writing to log_file,
// filtered at min_level
void init_logging(const std::string& log_file = "randomfs.log",
                  severity_level min_level = boost::log::trivial::info);

// Adjusts the core filter at run time
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Parses trace|debug|info|warning|error|fatal; throws std::invalid_argument
severity_level severity_from_string(const std::string& name);

} // namespace randomfs::logging

#endif // RANDOMFS_LOGGER_HPP
