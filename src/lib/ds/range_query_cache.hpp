#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

#include <ds/lru_cache.hpp>
#include <ds/plain_sums.hpp>
#include <math/default_group.hpp>

namespace rscache {

enum class LookupOutcome { kNone, kHit, kMiss };

struct CacheStats {
    size_t hits{};
    size_t misses{};
    size_t invalidations{};
};

// Serves Base's range sums through an LRU cache keyed by the closed interval.
// Every Update drops the cached intervals containing the written index, so a
// cached value always equals the sum over the current data.
//
// Not thread-safe: RangeSum mutates recency and stats, so concurrent callers
// need one exclusive lock around each whole call.
template <typename Base>
class RangeQueryCache : public Base {
   public:
    typedef typename Base::group_type group_type;
    typedef typename group_type::value_type value_type;
    typedef std::pair<ptrdiff_t, ptrdiff_t> Interval;

    template <typename I,
              std::enable_if_t<std::is_same<typename std::iterator_traits<I>::value_type,
                                            typename group_type::value_type>::value,
                               bool> = true>
    RangeQueryCache(size_t cache_size, I begin, I end) : Base(begin, end), cache_(cache_size) {}

    RangeQueryCache(std::vector<value_type> data, size_t cache_size)
        : Base(std::move(data)), cache_(cache_size) {}

    value_type RangeSum(ptrdiff_t l, ptrdiff_t r) {
        Base::CheckInterval(l, r);

        if (auto res = cache_.get({l, r})) {
            ++stats_.hits;
            last_lookup_ = LookupOutcome::kHit;
            return res.value();
        }

        auto res = Base::QueryImpl(l, r);
        cache_.put({l, r}, res);
        ++stats_.misses;
        last_lookup_ = LookupOutcome::kMiss;
        return res;
    }

    // Linear in the number of cached intervals.
    void Update(ptrdiff_t index, const value_type& value) {
        Base::CheckIndex(index);
        const auto keys = cache_.keys();
        Base::UpdateImpl(index, value);

        for (const auto& key : keys) {
            if (key.first <= index && index <= key.second) {
                cache_.erase(key);
                ++stats_.invalidations;
            }
        }
    }

    size_t CacheSize() const { return cache_.size(); }

    size_t CacheCapacity() const { return cache_.capacity(); }

    std::vector<Interval> CachedIntervals() const { return cache_.keys(); }

    bool IsCached(ptrdiff_t l, ptrdiff_t r) const { return cache_.contains({l, r}); }

    LookupOutcome LastLookup() const { return last_lookup_; }

    CacheStats Stats() const { return stats_; }

    void ResetStats() {
        stats_ = {};
        last_lookup_ = LookupOutcome::kNone;
    }

   private:
    struct IntervalHash {
        std::size_t operator()(const Interval& p) const noexcept {
            std::size_t h = std::hash<ptrdiff_t>{}(p.first);
            return h ^ (std::hash<ptrdiff_t>{}(p.second) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                        (h >> 2));
        }
    };

    LruCache<Interval, value_type, IntervalHash> cache_;
    CacheStats stats_{};
    LookupOutcome last_lookup_{LookupOutcome::kNone};
};

using RangeSumStore = RangeQueryCache<PlainSums<DefaultGroup<int64_t>>>;

}  // namespace rscache
