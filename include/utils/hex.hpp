#ifndef CFS_UTILS_HEX_HPP
#define CFS_UTILS_HEX_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfs {
namespace utils {

inline std::string encode_hex(const uint8_t* data, std::size_t length) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(length * 2);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(digits[(data[i] >> 4) & 0x0F]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

inline int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Returns nullopt on odd length or a non-hex character
inline std::optional<std::vector<uint8_t>> decode_hex(const std::string& text) {
  if (text.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    int high = hex_value(text[i]);
    int low = hex_value(text[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

} // namespace utils
} // namespace cfs

#endif // CFS_UTILS_HEX_HPP
