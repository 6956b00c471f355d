// SHA256_CTX is deprecated in OpenSSL 3 but it is the only OpenSSL interface
// whose internal state can be read back and restored.
#define OPENSSL_SUPPRESS_DEPRECATED

#include "digest/incremental_digest.hpp"
#include "utils/hex.hpp"
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <boost/log/trivial.hpp>
#include <cstring>

namespace cfs::digest {

//==============================================
// RAII WRAPPER AROUND THE OPENSSL HASH CONTEXT
//==============================================

struct HashContext {
  SHA256_CTX ctx;

  HashContext() {
    if (SHA256_Init(&ctx) != 1) {
      throw DigestError("Digest: Failed to initialize SHA-256 context");
    }
  }

  // Copy used by previews so the resumable context is never padded
  HashContext(const HashContext& other) = default;

  ~HashContext() {
    OPENSSL_cleanse(&ctx, sizeof(ctx));
  }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IncrementalDigest::IncrementalDigest()
  : context_(std::make_unique<HashContext>()) {
}

IncrementalDigest::~IncrementalDigest() = default;
IncrementalDigest::IncrementalDigest(IncrementalDigest&&) noexcept = default;
IncrementalDigest& IncrementalDigest::operator=(IncrementalDigest&&) noexcept = default;

//==============================================
// HASHING
//==============================================

void IncrementalDigest::update(const void* data, std::size_t length) {
  ensure_active("update");
  if (length == 0) {
    return;
  }
  if (SHA256_Update(&context_->ctx, data, length) != 1) {
    throw DigestError("Digest: SHA-256 update failed");
  }
}

//==============================================
// RESUMABILITY
//==============================================

Sha256Snapshot IncrementalDigest::export_state() const {
  ensure_active("export_state");
  const SHA256_CTX& ctx = context_->ctx;

  Sha256Snapshot snapshot;
  for (std::size_t i = 0; i < Sha256Snapshot::STATE_WORDS; ++i) {
    snapshot.state[i] = ctx.h[i];
  }
  snapshot.total_bytes = total_bytes();

  // OpenSSL keeps the uncompressed tail as raw bytes at the start of data[]
  const auto* tail = reinterpret_cast<const uint8_t*>(ctx.data);
  snapshot.pending.assign(tail, tail + ctx.num);

  BOOST_LOG_TRIVIAL(trace) << "Digest: Exported state at " << snapshot.total_bytes << " bytes";
  return snapshot;
}

IncrementalDigest IncrementalDigest::import_state(const Sha256Snapshot& snapshot) {
  snapshot.validate();
  if (snapshot.total_bytes > (UINT64_MAX >> 3)) {
    throw SnapshotFormatError("total length exceeds the SHA-256 message limit");
  }

  IncrementalDigest engine;
  SHA256_CTX& ctx = engine.context_->ctx;

  for (std::size_t i = 0; i < Sha256Snapshot::STATE_WORDS; ++i) {
    ctx.h[i] = snapshot.state[i];
  }

  // Nl/Nh count bits, not bytes
  const uint64_t bits = snapshot.total_bytes << 3;
  ctx.Nl = static_cast<SHA_LONG>(bits & 0xFFFFFFFFu);
  ctx.Nh = static_cast<SHA_LONG>(bits >> 32);

  std::memset(ctx.data, 0, sizeof(ctx.data));
  if (!snapshot.pending.empty()) {
    std::memcpy(ctx.data, snapshot.pending.data(), snapshot.pending.size());
  }
  ctx.num = static_cast<unsigned int>(snapshot.pending.size());

  BOOST_LOG_TRIVIAL(trace) << "Digest: Imported state at " << snapshot.total_bytes << " bytes";
  return engine;
}

//==============================================
// OUTPUT
//==============================================

Sha256Digest IncrementalDigest::preview_digest() const {
  ensure_active("preview_digest");
  HashContext scratch(*context_);
  Sha256Digest digest{};
  if (SHA256_Final(digest.data(), &scratch.ctx) != 1) {
    throw DigestError("Digest: SHA-256 preview failed");
  }
  return digest;
}

Sha256Digest IncrementalDigest::finalize_digest() {
  ensure_active("finalize_digest");
  Sha256Digest digest{};
  if (SHA256_Final(digest.data(), &context_->ctx) != 1) {
    throw DigestError("Digest: SHA-256 finalization failed");
  }
  finalized_ = true;
  return digest;
}

//==============================================
// GETTERS
//==============================================

uint64_t IncrementalDigest::total_bytes() const {
  if (!context_) {
    return 0;
  }
  const SHA256_CTX& ctx = context_->ctx;
  const uint64_t bits = (static_cast<uint64_t>(ctx.Nh) << 32) | ctx.Nl;
  return bits >> 3;
}

void IncrementalDigest::ensure_active(const char* operation) const {
  if (!context_) {
    throw EngineStateError(std::string(operation) + " on a moved-from engine");
  }
  if (finalized_) {
    BOOST_LOG_TRIVIAL(error) << "Digest: " << operation << " called after finalization";
    throw EngineStateError(std::string(operation) + " after finalize_digest");
  }
}

//==============================================
// HELPERS
//==============================================

std::string to_hex(const Sha256Digest& digest) {
  return utils::encode_hex(digest.data(), digest.size());
}

std::string empty_digest_hex() {
  return to_hex(IncrementalDigest().preview_digest());
}

} // namespace cfs::digest
