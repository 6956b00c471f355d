#ifndef CFS_DIGEST_INCREMENTAL_DIGEST_HPP
#define CFS_DIGEST_INCREMENTAL_DIGEST_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include "digest/sha256_snapshot.hpp"
#include "digest/digest_error.hpp"

namespace cfs::digest {

using Sha256Digest = std::array<uint8_t, 32>;

// Forward declaration for the OpenSSL hash context
struct HashContext;

class IncrementalDigest {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Empty engine, equivalent to hashing zero bytes so far
  IncrementalDigest();
  ~IncrementalDigest();

  IncrementalDigest(const IncrementalDigest&) = delete;
  IncrementalDigest& operator=(const IncrementalDigest&) = delete;
  IncrementalDigest(IncrementalDigest&&) noexcept;
  IncrementalDigest& operator=(IncrementalDigest&&) noexcept;


  // ---- HASHING ----
  void update(const void* data, std::size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }


  // ---- RESUMABILITY ----
  Sha256Snapshot export_state() const;
  static IncrementalDigest import_state(const Sha256Snapshot& snapshot);


  // ---- OUTPUT ----
  // Digest of everything hashed so far, computed on a throwaway copy
  Sha256Digest preview_digest() const;
  // Applies the final padding; the engine cannot be used afterwards
  Sha256Digest finalize_digest();


  // ---- GETTERS ----
  uint64_t total_bytes() const;
  bool is_finalized() const { return finalized_; }

private:
  std::unique_ptr<HashContext> context_;
  bool finalized_ = false;

  void ensure_active(const char* operation) const;
};

// Lowercase hex rendering used in metadata and entity tags
std::string to_hex(const Sha256Digest& digest);

// SHA-256 of zero bytes
std::string empty_digest_hex();

} // namespace cfs::digest

#endif // CFS_DIGEST_INCREMENTAL_DIGEST_HPP
