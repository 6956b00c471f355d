#ifndef CFS_UTILS_IDENTIFIERS_HPP
#define CFS_UTILS_IDENTIFIERS_HPP

#include <string>

namespace cfs {
namespace utils {

// Random RFC 4122 UUID used as an entry id
std::string generate_entry_id();

// Ids become path components, so only [0-9A-Za-z-] and at least 3 characters
bool is_valid_entry_id(const std::string& id);

// Current UTC time as ISO-8601 with millisecond precision, e.g. 2024-05-01T10:20:30.123Z
std::string iso8601_now();

} // namespace utils
} // namespace cfs

#endif // CFS_UTILS_IDENTIFIERS_HPP
