#ifndef RCACHE_LOGGER_HPP
#define RCACHE_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace rcache {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Sets up the Boost.Log core: a file sink, an optional console sink on stderr and
// a global severity filter. Replaces any sinks installed by an earlier call.
void init_logging(const std::string& log_file = "rcache.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Adjusts the global filter without touching the sinks
void set_min_severity(severity_level min_level);

// "trace", "debug", "info", "warning", "error", "fatal"
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace logger
} // namespace rcache

#endif // RCACHE_LOGGER_HPP
