#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace chunkflow::storage {

struct CacheStats {
    std::uint64_t entries = 0;
    std::uint64_t bytes = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    
    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

struct ContainerWeigher {
    template<typename T>
    std::uint64_t operator()(const T& value) const { return value.size(); }
};

// Bounded LRU store keyed by Key, limited by entry count and total weight.
// Entries older than the time-to-live are dropped on access and on purge.
template<typename Key, typename Value, typename Weigher = ContainerWeigher>
class ChunkCache {
public:
    using Clock = std::chrono::steady_clock;
    
    ChunkCache(size_t max_entries,
               std::uint64_t max_bytes,
               std::chrono::milliseconds ttl = std::chrono::milliseconds::zero())
        : max_entries_(max_entries)
        , max_bytes_(max_bytes)
        , ttl_(ttl) {}
    
    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        auto weight = Weigher{}(value);
        auto now = Clock::now();
        
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            stats_.bytes -= it->second.bytes;
            it->second.value = std::move(value);
            it->second.bytes = weight;
            it->second.stored_at = now;
            it->second.last_used = now;
            it->second.access_count++;
            stats_.bytes += weight;
            touch(it->second);
        } else {
            recency_.push_front(key);
            Entry entry{std::move(value), weight, now, now, 1, recency_.begin()};
            entries_.emplace(key, std::move(entry));
            stats_.bytes += weight;
        }
        
        // Never evict the entry just written
        while (entries_.size() > 1 &&
               (entries_.size() > max_entries_ || stats_.bytes > max_bytes_)) {
            evict_lru();
        }
        stats_.entries = entries_.size();
    }
    
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            stats_.misses++;
            return std::nullopt;
        }
        
        if (is_expired(it->second, Clock::now())) {
            erase_entry(it);
            stats_.expirations++;
            stats_.misses++;
            return std::nullopt;
        }
        
        stats_.hits++;
        it->second.last_used = Clock::now();
        it->second.access_count++;
        touch(it->second);
        return it->second.value;
    }
    
    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && !is_expired(it->second, Clock::now());
    }
    
    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        erase_entry(it);
        return true;
    }
    
    size_t purge_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        
        auto now = Clock::now();
        size_t purged = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(it->second, now)) {
                recency_.erase(it->second.position);
                stats_.bytes -= it->second.bytes;
                it = entries_.erase(it);
                purged++;
            } else {
                ++it;
            }
        }
        stats_.expirations += purged;
        stats_.entries = entries_.size();
        return purged;
    }
    
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        recency_.clear();
        stats_.bytes = 0;
        stats_.entries = 0;
    }
    
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
    
    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Entry {
        Value value;
        std::uint64_t bytes;
        typename Clock::time_point stored_at;
        typename Clock::time_point last_used;
        std::uint64_t access_count;
        typename std::list<Key>::iterator position;
    };
    
    using EntryMap = std::unordered_map<Key, Entry>;
    
    bool is_expired(const Entry& entry, typename Clock::time_point now) const {
        return ttl_.count() > 0 && now - entry.stored_at > ttl_;
    }
    
    void touch(Entry& entry) {
        recency_.splice(recency_.begin(), recency_, entry.position);
    }
    
    void erase_entry(typename EntryMap::iterator it) {
        recency_.erase(it->second.position);
        stats_.bytes -= it->second.bytes;
        entries_.erase(it);
        stats_.entries = entries_.size();
    }
    
    void evict_lru() {
        auto it = entries_.find(recency_.back());
        erase_entry(it);
        stats_.evictions++;
    }
    
    size_t max_entries_;
    std::uint64_t max_bytes_;
    std::chrono::milliseconds ttl_;
    
    EntryMap entries_;
    std::list<Key> recency_;
    CacheStats stats_;
    mutable std::mutex mutex_;
};

} // namespace chunkflow::storage
