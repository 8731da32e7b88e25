#ifndef CHUNKSTORE_LOGGER_HPP
#define CHUNKSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkstore::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a synchronous text file sink. The file is
// truncated on open and flushed after every record.
void init_logging(const std::string& log_file, severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink writing to std::clog
void init_console_logging(severity_level min_level = severity_level::info);

// Drops records below the given severity
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses trace, debug, info, warning, error or fatal (any case);
// throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace chunkstore::logging

#endif // CHUNKSTORE_LOGGER_HPP
