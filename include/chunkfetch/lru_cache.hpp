#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkfetch {

// Bounded map that evicts the least recently used entry when full.
//
// An optional predicate decides whether an entry may be evicted. Entries the
// predicate refuses are skipped; if no entry can be evicted the cache grows
// past its capacity rather than drop a pinned entry.
//
// Not synchronised: the owner serialises access.
template<typename K, typename V, typename Hash = std::hash<K>>
class LRUCache {
public:
    using key_type = K;
    using value_type = V;
    using evict_predicate = std::function<bool(const K&, const V&)>;

    explicit LRUCache(size_t capacity, evict_predicate can_evict = nullptr)
        : capacity_(capacity)
        , can_evict_(std::move(can_evict))
    {}

    // Lookup value, returns nullptr if not found.
    // Promotes entry if found.
    V* get(const K& key) {
        auto it = map_.find(key);
        if (it == map_.end()) {
            misses_++;
            return nullptr;
        }
        list_.splice(list_.begin(), list_, it->second);
        hits_++;
        return &it->second->value;
    }

    // Lookup without touching recency
    const V* peek(const K& key) const {
        auto it = map_.find(key);
        if (it == map_.end()) return nullptr;
        return &it->second->value;
    }

    // Insert or update value.
    // Returns evicted entries (caller may need to clean up).
    std::vector<std::pair<K, V>> put(const K& key, V value) {
        std::vector<std::pair<K, V>> evicted;

        if (auto it = map_.find(key); it != map_.end()) {
            it->second->value = std::move(value);
            list_.splice(list_.begin(), list_, it->second);
            return evicted;
        }

        while (list_.size() >= capacity_ && evict_one(evicted)) {
        }

        list_.push_front({key, std::move(value)});
        map_[key] = list_.begin();
        return evicted;
    }

    bool remove(const K& key) {
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        list_.erase(it->second);
        map_.erase(it);
        return true;
    }

    // Remove the entry only if pred(value) holds
    template<typename Pred>
    bool remove_if(const K& key, Pred&& pred) {
        auto it = map_.find(key);
        if (it == map_.end() || !pred(it->second->value)) return false;
        list_.erase(it->second);
        map_.erase(it);
        return true;
    }

    bool contains(const K& key) const {
        return map_.find(key) != map_.end();
    }

    size_t size() const noexcept { return list_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return list_.empty(); }
    bool over_capacity() const noexcept { return list_.size() > capacity_; }

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t pinned_skips = 0;
    };

    Stats stats() const {
        Stats s;
        s.hits = hits_;
        s.misses = misses_;
        s.evictions = evictions_;
        s.pinned_skips = pinned_skips_;
        return s;
    }

    void clear() {
        list_.clear();
        map_.clear();
    }

    // Iterate from most to least recently used
    template<typename F>
    void for_each(F&& func) const {
        for (const auto& entry : list_) {
            func(entry.key, entry.value);
        }
    }

private:
    struct Entry {
        K key;
        V value;
    };

    using list_type = std::list<Entry>;
    using iterator = typename list_type::iterator;

    // Evict the least recently used evictable entry
    bool evict_one(std::vector<std::pair<K, V>>& evicted) {
        for (auto it = list_.end(); it != list_.begin();) {
            --it;
            if (can_evict_ && !can_evict_(it->key, it->value)) {
                pinned_skips_++;
                continue;
            }
            map_.erase(it->key);
            evicted.emplace_back(std::move(it->key), std::move(it->value));
            list_.erase(it);
            evictions_++;
            return true;
        }
        return false;
    }

    size_t capacity_;
    evict_predicate can_evict_;
    list_type list_;
    std::unordered_map<K, iterator, Hash> map_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t pinned_skips_ = 0;
};

}  // namespace chunkfetch
