#pragma once
#include <cassert>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ds/errors.hpp>

namespace rscache {

// Fixed-capacity key-value store with strict least-recently-used eviction.
// Recency list runs from the LRU entry (front) to the MRU entry (back).
template <class Key, class T, class Hash = std::hash<Key>,
          class KeyEqual = std::equal_to<Key>>
class LruCache {
   public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) {
            throw CapacityInvalid{"capacity should be >= 1"};
        }
        hash_.reserve(capacity);
    }

    // Inserts or overwrites and marks the key most recently used. Overwriting
    // never evicts; a new key evicts the current LRU entry if the cache is full.
    void put(const Key& k, const T& v) {
        assert(list_.size() <= capacity_);
        assert(list_.size() == hash_.size());

        const auto hash_it = hash_.find(k);
        if (hash_it != hash_.end()) {
            hash_it->second->second = v;
            list_.splice(list_.end(), list_, hash_it->second);
        } else {
            if (is_full()) drop_one();
            auto list_it = list_.emplace(list_.end(), k, v);
            try {
                hash_.emplace(k, list_it);
            } catch (...) {
                list_.erase(list_it);
                throw;
            }
        }
        assert(hash_.find(k)->second == std::prev(list_.end()));
    }

    std::optional<T> get(const Key& k) {
        assert(list_.size() <= capacity_);
        assert(list_.size() == hash_.size());

        const auto hash_it = hash_.find(k);
        if (hash_it != hash_.end()) {
            list_.splice(list_.end(), list_, hash_it->second);
            return hash_it->second->second;
        } else {
            return std::nullopt;
        }
    }

    // Removing an absent key is a no-op.
    void erase(const Key& k) {
        const auto hash_it = hash_.find(k);
        if (hash_it == hash_.end()) return;
        list_.erase(hash_it->second);
        hash_.erase(hash_it);
    }

    // Copy of the held keys, LRU first. Independent of the cache, so the caller
    // may erase entries while walking it.
    std::vector<Key> keys() const {
        std::vector<Key> ret;
        ret.reserve(list_.size());
        for (const auto& [k, _] : list_) {
            ret.push_back(k);
        }
        return ret;
    }

    // Lookup without touching recency.
    bool contains(const Key& k) const { return hash_.find(k) != hash_.end(); }

    size_t size() const { return hash_.size(); }

    size_t capacity() const { return capacity_; }

   private:
    using List = std::list<std::pair<Key, T>>;
    using ListIterator = typename List::iterator;

    size_t capacity_;
    List list_;
    std::unordered_map<Key, ListIterator, Hash, KeyEqual> hash_;

    void drop_one() {
        assert(list_.size() > 0);
        assert(list_.size() == hash_.size());

        const auto it = list_.begin();

        assert(hash_.find(it->first) != hash_.end());
        assert(hash_.find(it->first)->second == it);

        hash_.erase(it->first);
        list_.erase(it);
    }

    bool is_full() const { return hash_.size() == capacity_; }
};

}  // namespace rscache
