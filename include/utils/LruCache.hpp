#pragma once
#include <list>
#include <unordered_map>
#include <utility>
#include <cstddef>

namespace FeedLine {

// Not synchronized; wrap it when shared across threads
template <typename K, typename V>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {}

    bool get(const K& key, V& out) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        entries_.splice(entries_.begin(), entries_, it->second);
        out = it->second->second;
        return true;
    }

    void put(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        if (capacity_ == 0) return;
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
        trim();
    }

    bool remove(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    bool contains(const K& key) const { return index_.count(key) > 0; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

    // Shrinking evicts the least recently used entries
    void setCapacity(size_t capacity) {
        capacity_ = capacity;
        trim();
    }

private:
    void trim() {
        while (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    using Entry = std::pair<K, V>;
    std::list<Entry> entries_;
    std::unordered_map<K, typename std::list<Entry>::iterator> index_;
    size_t capacity_;
};

}
