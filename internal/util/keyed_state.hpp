#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace freightline::util {

/*
  KeyedStateStore

  Concurrency-safe map from key to per-key state.

  - Each key owns a slot with its own mutex; WithState() holds it for the
    whole callback, so calls for one key are strictly serialized.
  - Shard mutexes only guard slot lookup/creation and are never held while
    a callback runs. Distinct keys proceed in parallel.
  - Lock order is always shard -> slot.
*/
template <typename State>
class KeyedStateStore {
 public:
  explicit KeyedStateStore(std::size_t shard_count = 32)
      : shard_count_(shard_count == 0 ? 1 : shard_count), shards_(std::make_unique<Shard[]>(shard_count_)) {
  }

  KeyedStateStore(const KeyedStateStore&)            = delete;
  KeyedStateStore& operator=(const KeyedStateStore&) = delete;

  // fn receives std::optional<State>&; nullopt means the key has no state yet.
  template <typename Fn>
  decltype(auto) WithState(const std::string& key, Fn&& fn) {
    auto             slot = AcquireSlot(key);
    std::scoped_lock lock(slot->mutex);
    return std::forward<Fn>(fn)(slot->state);
  }

  std::optional<State> Snapshot(const std::string& key) const {
    std::shared_ptr<Slot> slot;
    {
      auto&            shard = ShardFor(key);
      std::scoped_lock lock(shard.mutex);
      auto             it = shard.slots.find(key);
      if (it == shard.slots.end()) return std::nullopt;
      slot = it->second;
    }
    std::scoped_lock lock(slot->mutex);
    return slot->state;
  }

  bool Erase(const std::string& key) {
    auto&            shard = ShardFor(key);
    std::scoped_lock lock(shard.mutex);
    auto             it = shard.slots.find(key);
    if (it == shard.slots.end()) return false;

    // wait for an in-flight callback on this key
    auto slot = it->second;
    {
      std::scoped_lock slot_lock(slot->mutex);
      shard.slots.erase(it);
    }
    return true;
  }

  // Removes every key whose state satisfies pred. Returns the count removed.
  std::size_t EraseIf(const std::function<bool(const std::string&, const State&)>& pred) {
    std::size_t removed = 0;
    for (std::size_t i = 0; i < shard_count_; ++i) {
      auto&            shard = shards_[i];
      std::scoped_lock lock(shard.mutex);
      for (auto it = shard.slots.begin(); it != shard.slots.end();) {
        auto slot = it->second;
        bool drop = false;
        {
          std::scoped_lock slot_lock(slot->mutex);
          drop = slot->state && pred(it->first, *slot->state);
        }
        if (drop) {
          it = shard.slots.erase(it);
          ++removed;
        } else {
          ++it;
        }
      }
    }
    return removed;
  }

  void Clear() {
    for (std::size_t i = 0; i < shard_count_; ++i) {
      std::scoped_lock lock(shards_[i].mutex);
      shards_[i].slots.clear();
    }
  }

  std::size_t Size() const {
    std::size_t total = 0;
    for (std::size_t i = 0; i < shard_count_; ++i) {
      std::scoped_lock lock(shards_[i].mutex);
      total += shards_[i].slots.size();
    }
    return total;
  }

 private:
  struct Slot {
    std::mutex           mutex;
    std::optional<State> state;
  };

  struct Shard {
    mutable std::mutex                                     mutex;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots;
  };

  Shard& ShardFor(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % shard_count_];
  }

  std::shared_ptr<Slot> AcquireSlot(const std::string& key) {
    auto&            shard = ShardFor(key);
    std::scoped_lock lock(shard.mutex);
    auto&            slot = shard.slots[key];
    if (!slot) {
      slot = std::make_shared<Slot>();
    }
    return slot;
  }

  std::size_t              shard_count_;
  std::unique_ptr<Shard[]> shards_;
};

} // namespace freightline::util
