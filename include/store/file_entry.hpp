#ifndef CFS_STORE_FILE_ENTRY_HPP
#define CFS_STORE_FILE_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "digest/sha256_snapshot.hpp"

namespace cfs {
namespace store {

inline constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Metadata record of one stored file. The content itself lives in a blob
// next to the record; size and sha256 always describe exactly the first
// `size` bytes of that blob.
struct FileEntry {
  std::string id;
  // Display only, never used to address storage
  std::string name;
  std::string content_type = DEFAULT_CONTENT_TYPE;
  uint64_t size = 0;
  std::string last_update;
  std::string sha256;
  bool finalized = false;
  // Present while the upload is open, dropped at finalization
  std::optional<digest::Sha256Snapshot> saved_state;

  // Fresh, empty, non-finalized entry stamped with the current time
  static FileEntry make_new(const std::string& id, const std::string& name,
                            const std::string& content_type);
};

void to_json(nlohmann::json& j, const FileEntry& entry);
void from_json(const nlohmann::json& j, FileEntry& entry);

} // namespace store
} // namespace cfs

#endif // CFS_STORE_FILE_ENTRY_HPP
