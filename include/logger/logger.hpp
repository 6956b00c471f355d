#ifndef CFS_LOGGER_HPP
#define CFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace cfs::logging {

class Logger {
public:
    // Console sink always, text file sink when log_file is not empty
    static void init(const std::string& log_file, boost::log::trivial::severity_level min_level);

    static void set_level(boost::log::trivial::severity_level min_level);

    // Accepts trace, debug, info, warning, error, fatal; throws std::invalid_argument otherwise
    static boost::log::trivial::severity_level parse_level(const std::string& name);
};

} // namespace cfs::logging

#endif // CFS_LOGGER_HPP
