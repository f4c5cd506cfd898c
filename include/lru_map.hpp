#ifndef LRU_MAP_H
#define LRU_MAP_H

#include <cstddef>
#include <cstdint>
#include <list>
#include <unordered_map>
#include <utility>

// Keyed store with least-recently-used eviction. Not synchronized: callers
// either own it from a single shard thread or guard it themselves.
// A capacity of 0 means unbounded.
template<typename Key, typename Value>
class LruMap {
private:
    using Item = std::pair<Key, Value>;

    size_t capacity_;
    std::list<Item> items_;
    std::unordered_map<Key, typename std::list<Item>::iterator> index_;
    uint64_t evictions_ = 0;

public:
    explicit LruMap(size_t capacity = 0) : capacity_(capacity) {}

    // Returns the value for key, creating a default one if missing, and marks
    // it most recently used. May evict the least recently used entry.
    Value& get_or_create(const Key& key) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            items_.splice(items_.begin(), items_, it->second);
            return it->second->second;
        }

        items_.emplace_front(key, Value{});
        index_[key] = items_.begin();

        if (capacity_ > 0 && index_.size() > capacity_) {
            auto last = std::prev(items_.end());
            index_.erase(last->first);
            items_.pop_back();
            ++evictions_;
        }
        return items_.front().second;
    }

    // Inserts or replaces, marking the entry most recently used
    void put(const Key& key, Value value) {
        get_or_create(key) = std::move(value);
    }

    Value* find(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        items_.splice(items_.begin(), items_, it->second);
        return &it->second->second;
    }

    // Lookup without touching recency
    const Value* peek(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &it->second->second;
    }

    bool contains(const Key& key) const { return index_.count(key) > 0; }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        items_.erase(it->second);
        index_.erase(it);
        return true;
    }

    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }
    size_t capacity() const { return capacity_; }
    uint64_t evictions() const { return evictions_; }

    void clear() {
        index_.clear();
        items_.clear();
    }

    // Most recently used first
    template<typename Func>
    void for_each(Func&& func) const {
        for (const auto& item : items_) {
            func(item.first, item.second);
        }
    }
};

#endif // LRU_MAP_H
