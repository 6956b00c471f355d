#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace cfs::logging {

void Logger::init(const std::string& log_file, boost::log::trivial::severity_level min_level) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "]"
            << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " " << expr::smessage
    );

    logging::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);

    if (!log_file.empty()) {
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        logging::add_file_log(
            keywords::file_name = log_path.string(),
            keywords::format = format,
            keywords::open_mode = std::ios_base::out | std::ios_base::app,
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );
    }

    set_level(min_level);
    logging::core::get()->set_logging_enabled(true);
}

void Logger::set_level(boost::log::trivial::severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

boost::log::trivial::severity_level Logger::parse_level(const std::string& name) {
    using boost::log::trivial::severity_level;
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "fatal") return severity_level::fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace cfs::logging
