#include "range/range_reader.hpp"
#include "core/error.hpp"
#include "utils/media_type.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <vector>

namespace cfs {
namespace range {

namespace {

constexpr const char* RANGE_UNIT = "bytes=";

// Empty text yields nullopt, anything but plain digits throws
std::optional<uint64_t> parse_bound(const std::string& text, const std::string& header) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    throw RangeNotSatisfiableError("Range: Invalid bound '" + text + "' in " + header);
  }
  return value;
}

} // namespace

//==============================================
// RANGE HEADER PARSING
//==============================================

ByteRange parse_range_header(const std::string& header, uint64_t total) {
  const std::string unit = RANGE_UNIT;
  if (header.compare(0, unit.size(), unit) != 0) {
    throw BadRequestError("Range: Unsupported range unit in '" + header + "'");
  }

  std::string spec = boost::algorithm::trim_copy(header.substr(unit.size()));
  if (spec.find(',') != std::string::npos) {
    throw RangeNotSatisfiableError("Range: Multiple ranges are not supported: " + header);
  }

  const std::size_t dash = spec.find('-');
  if (dash == std::string::npos) {
    throw RangeNotSatisfiableError("Range: Malformed range spec: " + header);
  }

  auto first = parse_bound(boost::algorithm::trim_copy(spec.substr(0, dash)), header);
  auto last = parse_bound(boost::algorithm::trim_copy(spec.substr(dash + 1)), header);

  ByteRange range;
  range.start = first.value_or(0);
  // The header names the last byte inclusively
  range.end = last ? std::min(*last, total == 0 ? 0 : total - 1) + 1 : total;

  if (last && *last < range.start) {
    throw RangeNotSatisfiableError("Range: Range ends before it starts: " + header);
  }
  if (range.start >= total) {
    throw RangeNotSatisfiableError("Range: Range starts beyond " + std::to_string(total) + " bytes: " + header);
  }
  return range;
}

std::string ReadPlan::content_range() const {
  const uint64_t last = length == 0 ? offset : offset + length - 1;
  return "bytes " + std::to_string(offset) + "-" + std::to_string(last) + "/" + std::to_string(total);
}


//==============================================
// CONSTRUCTOR
//==============================================

RangeReader::RangeReader(const store::Store& store, uint64_t max_span)
  : store_(store)
  , max_span_(max_span) {
  BOOST_LOG_TRIVIAL(debug) << "Range: Reader limits partial responses to " << max_span_ << " bytes";
}


//==============================================
// READ PATH
//==============================================

ReadPlan RangeReader::plan(const store::FileEntry& entry, const std::optional<std::string>& range_header) const {
  ReadPlan plan;
  plan.total = entry.size;
  // Records written before content types were checked fall back to the default
  plan.content_type = utils::is_valid_media_type(entry.content_type)
    ? entry.content_type : store::DEFAULT_CONTENT_TYPE;
  plan.etag = "\"" + entry.sha256 + "\"";
  plan.blob = store_.blob_path(entry.id);

  if (!range_header) {
    plan.partial = false;
    plan.offset = 0;
    plan.length = entry.size;
    BOOST_LOG_TRIVIAL(debug) << "Range: Whole read of " << entry.id << " (" << entry.size << " bytes)";
    return plan;
  }

  ByteRange range = parse_range_header(*range_header, entry.size);
  if (range.length() > max_span_) {
    BOOST_LOG_TRIVIAL(debug) << "Range: Shortening " << range.length() << " byte request to " << max_span_;
    range.end = range.start + max_span_;
  }

  plan.partial = true;
  plan.offset = range.start;
  plan.length = range.length();
  BOOST_LOG_TRIVIAL(debug) << "Range: Partial read of " << entry.id << ": " << plan.content_range();
  return plan;
}

uint64_t RangeReader::copy(const ReadPlan& plan, const ChunkSink& sink) const {
  if (plan.length == 0) {
    return 0;
  }

  std::ifstream blob(plan.blob, std::ios::binary);
  if (!blob) {
    BOOST_LOG_TRIVIAL(error) << "Range: Failed to open blob " << plan.blob.string();
    throw store::StoreError("Range: Failed to open blob: " + plan.blob.string());
  }
  blob.seekg(static_cast<std::streamoff>(plan.offset));
  if (!blob) {
    throw store::StoreError("Range: Failed to seek blob: " + plan.blob.string());
  }

  std::vector<char> buffer(BUFFER_SIZE);
  uint64_t remaining = plan.length;
  uint64_t delivered = 0;

  // Never past plan.length: bytes beyond the committed size may belong to an
  // upload still in flight
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
    blob.read(buffer.data(), want);
    const std::streamsize got = blob.gcount();
    if (got <= 0) {
      BOOST_LOG_TRIVIAL(error) << "Range: Blob " << plan.blob.string() << " ended after "
                               << delivered << " of " << plan.length << " bytes";
      throw store::StoreError("Range: Blob shorter than recorded size: " + plan.blob.string());
    }

    if (!sink(buffer.data(), static_cast<std::size_t>(got))) {
      BOOST_LOG_TRIVIAL(info) << "Range: Reader went away after " << delivered << " bytes";
      return delivered;
    }
    delivered += static_cast<uint64_t>(got);
    remaining -= static_cast<uint64_t>(got);
  }

  return delivered;
}

} // namespace range
} // namespace cfs
