#ifndef CFS_UPLOAD_CHUNK_APPENDER_HPP
#define CFS_UPLOAD_CHUNK_APPENDER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include "store/store.hpp"
#include "digest/incremental_digest.hpp"
#include "upload/keyed_mutex.hpp"
#include "upload/content_classifier.hpp"

namespace cfs {
namespace upload {

struct ChunkRequest {
  std::string id;
  // Where the caller believes the chunk starts; must equal the current size
  uint64_t offset = 0;
  bool finalize = false;
  // Length announced by the transport, if it knows one
  std::optional<uint64_t> declared_length;
};

class ChunkAppender {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // classifier may be null, finalization then keeps the declared content type
  ChunkAppender(store::Store& store, KeyedMutex& locks,
                std::shared_ptr<ContentClassifier> classifier);


  // ---- APPEND ----
  // Appends one chunk and returns the committed entry.
  // Throws NotFoundError, ConflictError (finalized entry or wrong offset),
  // BadRequestError (missing or truncated body) and StoreError on I/O failure.
  // Nothing is committed unless the whole body was written.
  store::FileEntry append(const ChunkRequest& request, std::istream* body);

  static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

private:
  // ---- PARAMETERS ----
  store::Store& store_;
  KeyedMutex& locks_;
  std::shared_ptr<ContentClassifier> classifier_;


  // ---- APPEND STEPS ----
  // Rejects requests the entry cannot accept in its current state
  store::FileEntry load_and_validate(const ChunkRequest& request, std::istream* body) const;
  // Opens the blob with everything past `size` discarded and the cursor at `size`
  std::fstream open_blob(const std::filesystem::path& path, uint64_t size) const;
  // Restores the engine from the entry's snapshot
  digest::IncrementalDigest restore_digest(const store::FileEntry& entry) const;
  // Streams the body into the blob and the engine, returns bytes written
  uint64_t copy_body(std::istream& body, std::fstream& blob,
                     digest::IncrementalDigest& engine, const ChunkRequest& request) const;
  // Adopts the classifier's verdict when it has one
  void classify(store::FileEntry& entry) const;
};

} // namespace upload
} // namespace cfs

#endif // CFS_UPLOAD_CHUNK_APPENDER_HPP
