#ifndef CFS_DIGEST_SHA256_SNAPSHOT_HPP
#define CFS_DIGEST_SHA256_SNAPSHOT_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "digest/digest_error.hpp"

namespace cfs::digest {

// Resumable mid-computation SHA-256 state.
// Everything needed to continue hashing in another process: the chaining
// words, the exact number of bytes consumed so far and the tail that has not
// been compressed yet (always total_bytes % BLOCK_SIZE bytes long).
struct Sha256Snapshot {
  static constexpr std::size_t STATE_WORDS = 8;
  static constexpr std::size_t BLOCK_SIZE = 64;

  std::array<uint32_t, STATE_WORDS> state{};
  uint64_t total_bytes = 0;
  std::vector<uint8_t> pending;

  // Text form stored inside entry metadata:
  // sha256:<64 hex state>:<decimal total bytes>:<hex pending bytes>
  std::string serialize() const;
  static Sha256Snapshot deserialize(const std::string& text);

  // Throws SnapshotFormatError when pending does not match total_bytes
  void validate() const;
};

bool operator==(const Sha256Snapshot& left, const Sha256Snapshot& right);
bool operator!=(const Sha256Snapshot& left, const Sha256Snapshot& right);

} // namespace cfs::digest

#endif // CFS_DIGEST_SHA256_SNAPSHOT_HPP
