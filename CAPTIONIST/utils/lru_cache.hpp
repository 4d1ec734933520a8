#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace captionist::utils {

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    LruCache(const LruCache& other) : capacity_(other.capacity_) { copy_from(other); }
    LruCache& operator=(const LruCache& other) {
        if (this != &other) {
            capacity_ = other.capacity_;
            copy_from(other);
        }
        return *this;
    }
    LruCache(LruCache&&) = default;
    LruCache& operator=(LruCache&&) = default;

    std::optional<Value> get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
        while (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    template <typename Compute>
    Value get_or_compute(const Key& key, Compute&& compute) {
        if (auto cached = get(key)) {
            return *cached;
        }
        Value value = compute();
        put(key, value);
        return value;
    }

    bool contains(const Key& key) const { return index_.count(key) > 0; }
    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }

    void clear() {
        entries_.clear();
        index_.clear();
    }

private:
    using Entry = std::pair<Key, Value>;

    void copy_from(const LruCache& other) {
        entries_ = other.entries_;
        index_.clear();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    std::size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
};

}
