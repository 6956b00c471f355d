#ifndef CFS_UTILS_MEDIA_TYPE_HPP
#define CFS_UTILS_MEDIA_TYPE_HPP

#include <cctype>
#include <cstring>
#include <string>

namespace cfs {
namespace utils {

// HTTP token character
inline bool is_tchar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

// `type/subtype` made of tokens, optionally followed by `;` parameters of
// printable ASCII. Anything accepted can be written into a header field as is.
inline bool is_valid_media_type(const std::string& value) {
  const std::size_t params = value.find(';');
  const std::string essence = value.substr(0, params);

  const std::size_t slash = essence.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == essence.size()) {
    return false;
  }
  for (std::size_t i = 0; i < essence.size(); ++i) {
    if (i != slash && !is_tchar(essence[i])) {
      return false;
    }
  }

  if (params != std::string::npos) {
    for (std::size_t i = params; i < value.size(); ++i) {
      const unsigned char c = static_cast<unsigned char>(value[i]);
      if ((c < 0x20 && c != '\t') || c >= 0x7f) {
        return false;
      }
    }
  }
  return true;
}

} // namespace utils
} // namespace cfs

#endif // CFS_UTILS_MEDIA_TYPE_HPP
