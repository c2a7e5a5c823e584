#ifndef GFS_LOGGER_HPP
#define GFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink and, when log_file is not empty, a text file sink.
// Records below min_level are dropped.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Returns false and leaves level untouched for anything else.
bool parse_severity(const std::string& name, severity_level& level);

} // namespace logger
} // namespace gfs

#endif // GFS_LOGGER_HPP
