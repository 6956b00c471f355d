#ifndef CFS_RANGE_RANGE_READER_HPP
#define CFS_RANGE_RANGE_READER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "store/store.hpp"

namespace cfs {
namespace range {

// Half-open byte span [start, end)
struct ByteRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const { return end - start; }
};

// Parses a single-range `bytes=start-end` header against a content length.
// Missing start means 0, missing end means the end of the content, an end
// past the content is clamped. Throws BadRequestError when the header does
// not start with "bytes=" and RangeNotSatisfiableError for multiple ranges
// or spans that cannot be served.
ByteRange parse_range_header(const std::string& header, uint64_t total);

// Everything a transport needs to answer a read
struct ReadPlan {
  bool partial = false;
  uint64_t offset = 0;
  uint64_t length = 0;
  uint64_t total = 0;
  std::string content_type;
  std::string etag;
  std::filesystem::path blob;

  // "bytes <first>-<last>/<total>"
  std::string content_range() const;
};

// Receives consecutive slices of the content; returning false stops the copy
using ChunkSink = std::function<bool(const char* data, std::size_t length)>;

class RangeReader {
public:

  // ---- CONSTRUCTOR ----
  RangeReader(const store::Store& store, uint64_t max_span);


  // ---- READ PATH ----
  // Resolves the span to serve; a span longer than max_span is shortened
  ReadPlan plan(const store::FileEntry& entry, const std::optional<std::string>& range_header) const;
  // Streams the planned bytes to the sink, returns the number delivered
  uint64_t copy(const ReadPlan& plan, const ChunkSink& sink) const;


  // ---- GETTERS ----
  uint64_t max_span() const { return max_span_; }

  static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

private:
  const store::Store& store_;
  uint64_t max_span_;
};

} // namespace range
} // namespace cfs

#endif // CFS_RANGE_RANGE_READER_HPP
