#include "utils/identifiers.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace cfs {
namespace utils {

std::string generate_entry_id() {
  // random_generator is not thread safe, one per thread
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

bool is_valid_entry_id(const std::string& id) {
  if (id.size() < 3) {
    return false;
  }
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
      return false;
    }
  }
  return true;
}

std::string iso8601_now() {
  const auto now = boost::posix_time::microsec_clock::universal_time();
  const auto date = now.date();
  const auto time = now.time_of_day();

  std::ostringstream out;
  out << std::setfill('0')
      << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<int>(date.month()) << '-'
      << std::setw(2) << static_cast<int>(date.day()) << 'T'
      << std::setw(2) << time.hours() << ':'
      << std::setw(2) << time.minutes() << ':'
      << std::setw(2) << time.seconds() << '.'
      << std::setw(3) << (time.fractional_seconds() * 1000 / boost::posix_time::time_duration::ticks_per_second())
      << 'Z';
  return out.str();
}

} // namespace utils
} // namespace cfs
