#pragma once

#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace palm {
namespace util {

/**
 * ThreadSafeMap - map guarded by a single read/write lock
 *
 * Usage:
 *   ThreadSafeMap<std::string, ConnectionPtr> conns_;
 *   conns_.Insert(addr, conn);
 *
 *   // Shared (read) access
 *   conns_.Read(addr, [&](const ConnectionPtr& c) { state = c->net_state(); });
 *
 *   // Exclusive access
 *   conns_.Modify(addr, [](ConnectionPtr& c) { c->shutdown(); });
 *
 * Design decisions:
 * - All operations are atomic (single lock per operation)
 * - Read()/ForEach() take the lock shared; everything else takes it exclusive
 * - Access is callback based so no reference escapes the critical section
 * - No iterator-based API to avoid lock lifetime issues
 *
 * IMPORTANT: callbacks run with the lock held. They must be short, must not
 * block on I/O or wait on another thread, and must not call back into the
 * same map (the lock is not recursive).
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Insert only if key doesn't exist
     * Returns true if inserted, false if key already exists
     */
    bool TryInsert(const Key& key, const Value& value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.insert({key, value}).second;
    }

    /**
     * Calls reader(const Value&) under a shared lock if key exists
     * Returns true if key exists and was read, false otherwise
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            reader(it->second);
            return true;
        }
        return false;
    }

    /**
     * Calls modifier(Value&) under the exclusive lock if key exists
     * Returns true if key exists and was modified, false otherwise
     */
    template <typename Func>
    bool Modify(const Key& key, Func&& modifier) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            modifier(it->second);
            return true;
        }
        return false;
    }

    bool Contains(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    /**
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * Remove every entry for which predicate(key, value) is true
     * Returns number of removed entries
     */
    template <typename Pred>
    size_t EraseIf(Pred&& predicate) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();) {
            if (predicate(it->first, it->second)) {
                it = map_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    bool Empty() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.empty();
    }

    void Clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * Iterate over all entries under a shared lock
     * Callback signature: void(const Key&, const Value&)
     *
     * For expensive work, take a GetAll() snapshot first.
     */
    template <typename Func>
    void ForEach(Func&& callback) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, value] : map_) {
            callback(key, value);
        }
    }

    /**
     * Snapshot of all entries (safe to iterate without lock)
     */
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

    std::vector<Key> GetKeys() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, _] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

private:
    mutable std::shared_mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace palm
