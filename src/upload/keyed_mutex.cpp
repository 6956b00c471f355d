#include "upload/keyed_mutex.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace upload {

//==============================================
// GUARD
//==============================================

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key, Slot* slot)
  : owner_(&owner)
  , key_(std::move(key))
  , slot_(slot) {
}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
  : owner_(other.owner_)
  , key_(std::move(other.key_))
  , slot_(other.slot_) {
  other.owner_ = nullptr;
  other.slot_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
  if (owner_ && slot_) {
    owner_->release(key_, slot_);
  }
}

//==============================================
// LOCKING
//==============================================

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> registry(registry_mutex_);
    auto& entry = slots_[key];
    if (!entry) {
      entry = std::make_unique<Slot>();
    }
    ++entry->users;
    slot = entry.get();
  }

  // Wait outside the registry lock so other keys stay available
  slot->mutex.lock();
  BOOST_LOG_TRIVIAL(trace) << "Keyed mutex: Acquired " << key;
  return Guard(*this, key, slot);
}

void KeyedMutex::release(const std::string& key, Slot* slot) {
  slot->mutex.unlock();
  BOOST_LOG_TRIVIAL(trace) << "Keyed mutex: Released " << key;

  std::lock_guard<std::mutex> registry(registry_mutex_);
  if (--slot->users == 0) {
    slots_.erase(key);
  }
}

std::size_t KeyedMutex::active_keys() const {
  std::lock_guard<std::mutex> registry(registry_mutex_);
  return slots_.size();
}

} // namespace upload
} // namespace cfs
