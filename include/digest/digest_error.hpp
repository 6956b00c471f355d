#ifndef CFS_DIGEST_ERROR_HPP
#define CFS_DIGEST_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cfs::digest {

class DigestError : public std::runtime_error {
public:
  explicit DigestError(const std::string& message)
    : std::runtime_error(message) {}
};

class SnapshotFormatError : public DigestError {
public:
  explicit SnapshotFormatError(const std::string& message)
    : DigestError("Snapshot format error: " + message) {}
};

class EngineStateError : public DigestError {
public:
  explicit EngineStateError(const std::string& message)
    : DigestError("Engine state error: " + message) {}
};

} // namespace cfs::digest

#endif // CFS_DIGEST_ERROR_HPP
