#ifndef CFS_UPLOAD_KEYED_MUTEX_HPP
#define CFS_UPLOAD_KEYED_MUTEX_HPP

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cfs {
namespace upload {

// One mutex per key, created on demand and released when nobody holds or
// waits for it. Holders of different keys never block each other.
class KeyedMutex {
private:
  struct Slot {
    std::mutex mutex;
    std::size_t users = 0;
  };

public:
  class Guard {
  public:
    Guard(KeyedMutex& owner, std::string key, Slot* slot);
    ~Guard();

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;

    const std::string& key() const { return key_; }

  private:
    KeyedMutex* owner_;
    std::string key_;
    Slot* slot_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex&) = delete;
  KeyedMutex& operator=(const KeyedMutex&) = delete;

  // Blocks until the key is free
  Guard lock(const std::string& key);

  // Number of keys currently held or awaited
  std::size_t active_keys() const;

private:
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;

  void release(const std::string& key, Slot* slot);
};

} // namespace upload
} // namespace cfs

#endif // CFS_UPLOAD_KEYED_MUTEX_HPP
