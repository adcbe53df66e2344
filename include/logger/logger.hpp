#ifndef RCOPY_LOGGER_HPP
#define RCOPY_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace rcopy::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
    // Records below this level are dropped by every sink
    severity_level min_level = boost::log::trivial::info;
    // Also write to this file when set
    std::string log_file;
    // Write to stderr
    bool console = true;
};

// Maps the -q/-d flags to a minimum level. quiet wins over debug.
LogConfig config_for_flags(bool quiet, bool debug);

// Replaces all sinks with the ones described by config. The level filter is
// attached to each sink, so the core carries no global filter.
void init_logging(const LogConfig& config);

// Flushes and removes every sink
void shutdown_logging();

} // namespace rcopy::logging

#endif // RCOPY_LOGGER_HPP
