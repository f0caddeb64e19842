#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace freight::util {

/*
  Registry of per-key mutexes.

  Aggregates (a shipment, a driver) get their own critical section so that
  congestion on one key never stalls another. An entry exists only while
  some KeyedLock holds or waits on it; the last one out erases it.
*/
class KeyedMutex {
 public:
  std::shared_ptr<std::mutex> For(const std::string& key) {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       entry = mutexes_[key];
    if (!entry) {
      entry = std::make_shared<std::mutex>();
    }
    return entry;
  }

  // Gives back a reference taken by For; the entry goes once no holder is left.
  // References are only copied and dropped under guard_, so use_count is exact.
  void Release(const std::string& key, std::shared_ptr<std::mutex>& mutex) {
    std::lock_guard<std::mutex> lock(guard_);
    auto                        it = mutexes_.find(key);
    mutex.reset();
    if (it != mutexes_.end() && it->second.use_count() == 1) {
      mutexes_.erase(it);
    }
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(guard_);
    return mutexes_.size();
  }

 private:
  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

// Keeps the registry entry alive alongside the lock it guards.
class KeyedLock {
 public:
  KeyedLock(KeyedMutex& registry, const std::string& key) : registry_(registry), key_(key), mutex_(registry.For(key)), lock_(*mutex_) {
  }

  ~KeyedLock() {
    lock_.unlock();
    registry_.Release(key_, mutex_);
  }

  KeyedLock(const KeyedLock&)            = delete;
  KeyedLock& operator=(const KeyedLock&) = delete;

 private:
  KeyedMutex&                  registry_;
  std::string                  key_;
  std::shared_ptr<std::mutex>  mutex_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace freight::util
