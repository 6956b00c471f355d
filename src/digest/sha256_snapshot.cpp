#include "digest/sha256_snapshot.hpp"
#include "utils/hex.hpp"
#include <boost/log/trivial.hpp>
#include <charconv>

namespace cfs::digest {

namespace {

constexpr const char* SNAPSHOT_TAG = "sha256";

std::vector<std::string> split_fields(const std::string& text) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  for (;;) {
    std::size_t colon = text.find(':', start);
    if (colon == std::string::npos) {
      fields.push_back(text.substr(start));
      return fields;
    }
    fields.push_back(text.substr(start, colon - start));
    start = colon + 1;
  }
}

} // namespace

//==============================================
// VALIDATION
//==============================================

void Sha256Snapshot::validate() const {
  if (pending.size() >= BLOCK_SIZE) {
    throw SnapshotFormatError("pending block holds " + std::to_string(pending.size()) + " bytes");
  }
  if (pending.size() != total_bytes % BLOCK_SIZE) {
    throw SnapshotFormatError("pending length " + std::to_string(pending.size()) +
                              " does not match total length " + std::to_string(total_bytes));
  }
}

//==============================================
// TEXT FORM
//==============================================

std::string Sha256Snapshot::serialize() const {
  validate();

  std::vector<uint8_t> state_bytes;
  state_bytes.reserve(STATE_WORDS * 4);
  for (uint32_t word : state) {
    // Big endian so the text form is platform independent
    state_bytes.push_back(static_cast<uint8_t>(word >> 24));
    state_bytes.push_back(static_cast<uint8_t>(word >> 16));
    state_bytes.push_back(static_cast<uint8_t>(word >> 8));
    state_bytes.push_back(static_cast<uint8_t>(word));
  }

  std::string text = SNAPSHOT_TAG;
  text += ':';
  text += utils::encode_hex(state_bytes.data(), state_bytes.size());
  text += ':';
  text += std::to_string(total_bytes);
  text += ':';
  text += utils::encode_hex(pending.data(), pending.size());
  return text;
}

Sha256Snapshot Sha256Snapshot::deserialize(const std::string& text) {
  auto fields = split_fields(text);
  if (fields.size() != 4 || fields[0] != SNAPSHOT_TAG) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Unrecognised snapshot text";
    throw SnapshotFormatError("expected sha256:<state>:<length>:<pending>");
  }

  auto state_bytes = utils::decode_hex(fields[1]);
  if (!state_bytes || state_bytes->size() != STATE_WORDS * 4) {
    throw SnapshotFormatError("state must be " + std::to_string(STATE_WORDS * 8) + " hex digits");
  }

  Sha256Snapshot snapshot;
  for (std::size_t i = 0; i < STATE_WORDS; ++i) {
    const uint8_t* p = state_bytes->data() + i * 4;
    snapshot.state[i] = (static_cast<uint32_t>(p[0]) << 24) |
                        (static_cast<uint32_t>(p[1]) << 16) |
                        (static_cast<uint32_t>(p[2]) << 8) |
                        static_cast<uint32_t>(p[3]);
  }

  const std::string& length = fields[2];
  auto [end, ec] = std::from_chars(length.data(), length.data() + length.size(), snapshot.total_bytes);
  if (length.empty() || ec != std::errc() || end != length.data() + length.size()) {
    throw SnapshotFormatError("invalid total length '" + length + "'");
  }

  auto pending = utils::decode_hex(fields[3]);
  if (!pending) {
    throw SnapshotFormatError("pending bytes are not hex");
  }
  snapshot.pending = std::move(*pending);

  snapshot.validate();
  return snapshot;
}

bool operator==(const Sha256Snapshot& left, const Sha256Snapshot& right) {
  return left.state == right.state &&
         left.total_bytes == right.total_bytes &&
         left.pending == right.pending;
}

bool operator!=(const Sha256Snapshot& left, const Sha256Snapshot& right) {
  return !(left == right);
}

} // namespace cfs::digest
