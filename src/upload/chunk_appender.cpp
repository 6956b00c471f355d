#include "upload/chunk_appender.hpp"
#include "core/error.hpp"
#include "utils/identifiers.hpp"
#include "utils/media_type.hpp"
#include <boost/log/trivial.hpp>
#include <vector>

namespace cfs {
namespace upload {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkAppender::ChunkAppender(store::Store& store, KeyedMutex& locks,
                             std::shared_ptr<ContentClassifier> classifier)
  : store_(store)
  , locks_(locks)
  , classifier_(std::move(classifier)) {
  BOOST_LOG_TRIVIAL(debug) << "Append: Chunk appender ready"
                           << (classifier_ ? "" : " (content classification disabled)");
}


//==============================================
// APPEND
//==============================================

store::FileEntry ChunkAppender::append(const ChunkRequest& request, std::istream* body) {
  BOOST_LOG_TRIVIAL(info) << "Append: Chunk for " << request.id << " at offset " << request.offset
                          << (request.finalize ? " (finalize)" : "");

  // Offset check, blob write and commit must not interleave with another
  // writer of the same entry
  auto guard = locks_.lock(request.id);

  store::FileEntry entry = load_and_validate(request, body);
  digest::IncrementalDigest engine = restore_digest(entry);

  const std::filesystem::path blob_path = store_.blob_path(entry.id);
  uint64_t written = 0;
  {
    std::fstream blob = open_blob(blob_path, entry.size);
    if (body) {
      written = copy_body(*body, blob, engine, request);
    }
    blob.flush();
    if (!blob.good()) {
      BOOST_LOG_TRIVIAL(error) << "Append: Failed to flush blob " << blob_path.string();
      throw store::StoreError("Append: Failed to flush blob: " + blob_path.string());
    }
  }

  entry.size += written;
  if (request.finalize) {
    entry.saved_state.reset();
    entry.sha256 = digest::to_hex(engine.finalize_digest());
    entry.finalized = true;
    classify(entry);
  } else {
    entry.saved_state = engine.export_state();
    entry.sha256 = digest::to_hex(engine.preview_digest());
  }
  entry.last_update = utils::iso8601_now();
  store_.save(entry);

  BOOST_LOG_TRIVIAL(info) << "Append: Committed " << written << " bytes to " << entry.id
                          << ", size " << entry.size << (entry.finalized ? ", finalized" : "");
  return entry;
}


//==============================================
// APPEND STEPS
//==============================================

store::FileEntry ChunkAppender::load_and_validate(const ChunkRequest& request, std::istream* body) const {
  std::optional<store::FileEntry> entry = store_.find(request.id);
  if (!entry) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Unknown entry " << request.id;
    throw NotFoundError("Append: Unknown entry " + request.id);
  }

  if (entry->finalized) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Entry " << request.id << " is already finalized";
    throw ConflictError("Append: Entry " + request.id + " is already finalized");
  }

  if (request.offset != entry->size) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Offset " << request.offset << " does not match size "
                               << entry->size << " of " << request.id;
    throw ConflictError("Append: Expected offset " + std::to_string(entry->size) +
                        ", got " + std::to_string(request.offset));
  }

  if (!body && request.declared_length.value_or(1) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Missing body for " << request.id;
    throw BadRequestError("Append: Missing request body");
  }

  return *entry;
}

std::fstream ChunkAppender::open_blob(const std::filesystem::path& path, uint64_t size) const {
  std::filesystem::create_directories(path.parent_path());

  if (!std::filesystem::exists(path)) {
    std::ofstream create(path, std::ios::binary);
    if (!create) {
      throw store::StoreError("Append: Failed to create blob: " + path.string());
    }
  }

  const uint64_t on_disk = std::filesystem::file_size(path);
  if (on_disk < size) {
    BOOST_LOG_TRIVIAL(error) << "Append: Blob " << path.string() << " holds " << on_disk
                             << " bytes but the entry records " << size;
    throw store::StoreError("Append: Blob shorter than recorded size: " + path.string());
  }
  if (on_disk > size) {
    // Leftovers of an interrupted chunk that was never committed
    BOOST_LOG_TRIVIAL(info) << "Append: Discarding " << (on_disk - size) << " uncommitted bytes of "
                            << path.string();
    std::filesystem::resize_file(path, size);
  }

  std::fstream blob(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!blob) {
    throw store::StoreError("Append: Failed to open blob: " + path.string());
  }
  blob.seekp(static_cast<std::streamoff>(size));
  if (!blob) {
    throw store::StoreError("Append: Failed to seek blob: " + path.string());
  }
  return blob;
}

digest::IncrementalDigest ChunkAppender::restore_digest(const store::FileEntry& entry) const {
  if (entry.saved_state) {
    if (entry.saved_state->total_bytes != entry.size) {
      BOOST_LOG_TRIVIAL(error) << "Append: Digest state of " << entry.id << " covers "
                               << entry.saved_state->total_bytes << " bytes, entry size is " << entry.size;
      throw store::StoreError("Append: Digest state out of step with entry " + entry.id);
    }
    return digest::IncrementalDigest::import_state(*entry.saved_state);
  }

  // Records written before any chunk may carry no state at all
  if (entry.size != 0) {
    throw store::StoreError("Append: Missing digest state for entry " + entry.id);
  }
  return digest::IncrementalDigest();
}

uint64_t ChunkAppender::copy_body(std::istream& body, std::fstream& blob,
                                  digest::IncrementalDigest& engine, const ChunkRequest& request) const {
  std::vector<char> buffer(BUFFER_SIZE);
  uint64_t written = 0;

  while (body) {
    body.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = body.gcount();
    if (count <= 0) {
      break;
    }

    blob.write(buffer.data(), count);
    if (!blob) {
      BOOST_LOG_TRIVIAL(error) << "Append: Failed to write blob of " << request.id;
      throw store::StoreError("Append: Failed to write blob of " + request.id);
    }
    engine.update(buffer.data(), static_cast<std::size_t>(count));
    written += static_cast<uint64_t>(count);
  }

  if (body.bad()) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Body of " << request.id << " failed after " << written << " bytes";
    throw BadRequestError("Append: Request body failed after " + std::to_string(written) + " bytes");
  }

  if (request.declared_length && *request.declared_length != written) {
    BOOST_LOG_TRIVIAL(warning) << "Append: Body of " << request.id << " ended after " << written
                               << " of " << *request.declared_length << " bytes";
    throw BadRequestError("Append: Body ended after " + std::to_string(written) + " of " +
                          std::to_string(*request.declared_length) + " bytes");
  }

  BOOST_LOG_TRIVIAL(debug) << "Append: Streamed " << written << " bytes into " << request.id;
  return written;
}

void ChunkAppender::classify(store::FileEntry& entry) const {
  if (!classifier_) {
    return;
  }

  try {
    auto guessed = classifier_->classify(store_.blob_path(entry.id));
    if (guessed && !utils::is_valid_media_type(*guessed)) {
      BOOST_LOG_TRIVIAL(warning) << "Append: Ignoring malformed content type from classifier for " << entry.id;
    } else if (guessed) {
      BOOST_LOG_TRIVIAL(info) << "Append: Content type of " << entry.id << " is " << *guessed;
      entry.content_type = *guessed;
    }
  } catch (const std::exception& e) {
    // Finalization never depends on the classifier
    BOOST_LOG_TRIVIAL(warning) << "Append: Content classification of " << entry.id << " failed: " << e.what();
  }
}

} // namespace upload
} // namespace cfs
