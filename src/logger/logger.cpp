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

namespace gfs {
namespace logger {

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace logging = boost::log;
  namespace expr = boost::log::expressions;
  namespace sinks = boost::log::sinks;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    auto formatter = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " [" << logging::trivial::severity << "] "
      << expr::smessage;

    // Console sink, stderr so client output on stdout stays clean
    auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
    console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_backend->auto_flush(true);
    auto console_sink = boost::make_shared<sinks::synchronous_sink<sinks::text_ostream_backend>>(console_backend);
    console_sink->set_formatter(formatter);
    logging::core::get()->add_sink(console_sink);

    if (!log_file.empty()) {
      auto file_backend = boost::make_shared<sinks::text_file_backend>();
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      file_backend->set_file_name_pattern(log_path.string());
      file_backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
      file_backend->auto_flush(true);

      auto file_sink = boost::make_shared<sinks::synchronous_sink<sinks::text_file_backend>>(file_backend);
      file_sink->set_formatter(formatter);
      logging::core::get()->add_sink(file_sink);
    }

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

bool parse_severity(const std::string& name, severity_level& level) {
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace logger
} // namespace gfs
