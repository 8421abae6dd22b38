// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef GLYPHTEXT_GLYPHTEXT_LRU_CACHE_HH
#define GLYPHTEXT_GLYPHTEXT_LRU_CACHE_HH

#include <defs.hh>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include <boost/noncopyable.hpp>

namespace glyphtext {

struct cache_stats_t
{
    long entries, capacity;
    long hits, misses, evictions;

    double hit_rate() const {
        const auto total = hits + misses;
        return total ? double(hits) / total : 0.;
    }
};

//
// Bounded, thread-safe key-value store with least-recently-used eviction. A
// capacity of zero or less leaves the cache unbounded. Each successful lookup
// and each store makes the entry the most recently used one:
//
template< typename K, typename V, typename H = std::hash< K > >
struct lru_cache_t : private boost::noncopyable
{
    using key_type = K;
    using mapped_type = V;

    explicit lru_cache_t(long capacity = 0) : capacity_(capacity) { }

    std::optional< V > get(const K &key) {
        std::lock_guard< std::mutex > guard(mutex_);

        auto iter = entries_.find(key);

        if (iter == entries_.end()) {
            ++misses_;
            return { };
        }

        ++hits_;
        touch(*iter);

        return iter->second.value;
    }

    void put(const K &key, V value) {
        std::lock_guard< std::mutex > guard(mutex_);
        do_put(key, std::move(value));
    }

    //
    // Look up the key, or compute and store the value on a miss. The
    // computation runs without the lock held; concurrent misses on the same
    // key may both compute, the last store wins. Exceptions thrown by the
    // computation propagate and nothing is stored:
    //
    template< typename F >
    V get_or_compute(const K &key, F &&f) {
        if (auto value = get(key))
            return std::move(*value);

        V value = std::forward< F >(f)();

        {
            std::lock_guard< std::mutex > guard(mutex_);
            do_put(key, value);
        }

        return value;
    }

    bool contains(const K &key) const {
        std::lock_guard< std::mutex > guard(mutex_);
        return entries_.count(key);
    }

    bool erase(const K &key) {
        std::lock_guard< std::mutex > guard(mutex_);

        auto iter = entries_.find(key);

        if (iter == entries_.end())
            return false;

        order_.erase(iter->second.use);
        entries_.erase(iter);

        return true;
    }

    void clear() {
        std::lock_guard< std::mutex > guard(mutex_);
        entries_.clear();
        order_.clear();
    }

    long size() const {
        std::lock_guard< std::mutex > guard(mutex_);
        return long(entries_.size());
    }

    long capacity() const {
        std::lock_guard< std::mutex > guard(mutex_);
        return capacity_;
    }

    //
    // Shrinking the capacity evicts the least recently used entries in
    // excess, immediately:
    //
    void capacity(long n) {
        std::lock_guard< std::mutex > guard(mutex_);
        capacity_ = n;
        trim();
    }

    cache_stats_t stats() const {
        std::lock_guard< std::mutex > guard(mutex_);
        return cache_stats_t{
            long(entries_.size()), capacity_, hits_, misses_, evictions_ };
    }

    void reset_stats() {
        std::lock_guard< std::mutex > guard(mutex_);
        hits_ = misses_ = evictions_ = 0;
    }

private:
    struct entry_t
    {
        V value;
        std::uint64_t use;
    };

    using entries_type = std::unordered_map< K, entry_t, H >;

    void touch(typename entries_type::value_type &elt) {
        order_.erase(elt.second.use);
        elt.second.use = ++clock_;
        order_.emplace(elt.second.use, elt.first);
    }

    void do_put(const K &key, V value) {
        auto iter = entries_.find(key);

        if (iter != entries_.end()) {
            iter->second.value = std::move(value);
            touch(*iter);
            return;
        }

        if (capacity_ > 0 && long(entries_.size()) >= capacity_) {
            //
            // Make room for exactly one entry:
            //
            evict();
        }

        const auto use = ++clock_;

        entries_.emplace(key, entry_t{ std::move(value), use });
        order_.emplace(use, key);
    }

    void evict() {
        ASSERT(!order_.empty());

        auto oldest = order_.begin();

        entries_.erase(oldest->second);
        order_.erase(oldest);

        ++evictions_;
    }

    void trim() {
        if (capacity_ <= 0)
            return;

        while (long(entries_.size()) > capacity_)
            evict();
    }

private:
    mutable std::mutex mutex_;

    entries_type entries_;

    //
    // Recency order, oldest first:
    //
    std::map< std::uint64_t, K > order_;
    std::uint64_t clock_ = 0;

    long capacity_;
    long hits_ = 0, misses_ = 0, evictions_ = 0;
};

} // namespace glyphtext

#endif // GLYPHTEXT_GLYPHTEXT_LRU_CACHE_HH
