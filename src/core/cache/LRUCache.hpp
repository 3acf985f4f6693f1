#pragma once

/**
 * LRUCache.hpp
 *
 * Bounded, thread-safe least-recently-used cache.
 * Memoizes per-file decisions (media inspection, transcode options).
 */

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace homestream::core {

/**
 * LRUCache - fixed capacity map with recency eviction
 *
 * A single mutex guards the index and the recency list. Values are
 * computed outside the lock, so two callers missing on the same key may
 * both compute; the later insert wins. A capacity of zero (or less)
 * disables caching and every getOrCompute call computes.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
public:
    explicit LRUCache(long capacity)
        : m_capacity(capacity > 0 ? static_cast<size_t>(capacity) : 0) {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    /**
     * Return the cached value for key, computing and storing it on a miss
     * @param key Cache key
     * @param compute Called at most once per miss, without the lock held
     */
    template<typename Compute>
    Value getOrCompute(const Key& key, Compute&& compute) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (auto* value = touch(key)) {
                ++m_hitCount;
                return *value;
            }
            ++m_missCount;
        }

        Value value = compute();

        if (m_capacity > 0) {
            std::lock_guard<std::mutex> lock(m_mutex);
            insert(key, value);
        }
        return value;
    }

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto* value = touch(key)) {
            ++m_hitCount;
            return *value;
        }
        ++m_missCount;
        return std::nullopt;
    }

    void put(const Key& key, Value value) {
        if (m_capacity == 0) return;
        std::lock_guard<std::mutex> lock(m_mutex);
        insert(key, std::move(value));
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_index.find(key) != m_index.end();
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(key);
        if (it == m_index.end()) return false;
        m_order.erase(it->second);
        m_index.erase(it);
        return true;
    }

    /**
     * Remove every entry whose key matches
     * @return Number of entries removed
     */
    template<typename Pred>
    size_t eraseIf(Pred&& pred) {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t removed = 0;
        for (auto it = m_order.begin(); it != m_order.end(); ) {
            if (pred(it->first)) {
                m_index.erase(it->first);
                it = m_order.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_order.clear();
        m_index.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_index.size();
    }

    size_t capacity() const { return m_capacity; }

    size_t hitCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_hitCount;
    }

    size_t missCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_missCount;
    }

private:
    using Entry = std::pair<Key, Value>;
    using Order = std::list<Entry>;

    // Caller holds m_mutex
    Value* touch(const Key& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) return nullptr;
        m_order.splice(m_order.begin(), m_order, it->second);
        return &it->second->second;
    }

    // Caller holds m_mutex
    void insert(const Key& key, Value value) {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it->second->second = std::move(value);
            m_order.splice(m_order.begin(), m_order, it->second);
            return;
        }

        m_order.emplace_front(key, std::move(value));
        m_index.emplace(key, m_order.begin());

        while (m_index.size() > m_capacity) {
            m_index.erase(m_order.back().first);
            m_order.pop_back();
        }
    }

    const size_t m_capacity;
    Order m_order;   // front = most recently used
    std::unordered_map<Key, typename Order::iterator, Hash> m_index;
    mutable std::mutex m_mutex;
    size_t m_hitCount{0};
    size_t m_missCount{0};
};

} // namespace homestream::core
