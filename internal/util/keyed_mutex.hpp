#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace dispatcher::util {

/*
  Map of per-key mutexes.

  The map only holds weak references: a key's mutex lives as long as some
  caller holds the handle returned by Get(). Cleanup() drops the entries
  nobody holds any more.
*/
template <typename Key>
class KeyedMutex {
 public:
  std::shared_ptr<std::mutex> Get(const Key& key) {
    std::lock_guard lock(mutex_);

    auto& slot = entries_[key];
    if (auto existing = slot.lock()) {
      return existing;
    }

    auto created = std::make_shared<std::mutex>();
    slot         = created;
    return created;
  }

  // Returns the number of entries removed.
  std::size_t Cleanup() {
    std::lock_guard lock(mutex_);

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.expired()) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
  }

 private:
  mutable std::mutex                                  mutex_;
  std::unordered_map<Key, std::weak_ptr<std::mutex>> entries_;
};

} // namespace dispatcher::util
