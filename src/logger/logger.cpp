#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
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

namespace rcache {
namespace logger {

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    auto formatter =
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage;

    // File sink, truncated on every run
    auto backend = boost::make_shared<sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::trunc);
    backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto file = boost::make_shared<file_sink>(backend);
    file->set_formatter(formatter);
    logging::core::get()->add_sink(file);

    if (console) {
      auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(console_backend);
      sink->set_formatter(expr::stream << "[" << logging::trivial::severity << "] " << expr::smessage);
      logging::core::get()->add_sink(sink);
    }

    logging::add_common_attributes();
    set_min_severity(min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_min_severity(severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

std::optional<severity_level> parse_severity(const std::string& name) {
  for (int i = logging::trivial::trace; i <= logging::trivial::fatal; ++i) {
    const auto level = static_cast<severity_level>(i);
    if (name == logging::trivial::to_string(level)) {
      return level;
    }
  }
  return std::nullopt;
}

} // namespace logger
} // namespace rcache
