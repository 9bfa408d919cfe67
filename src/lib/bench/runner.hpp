#pragma once
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include <ds/range_query_cache.hpp>

#include "config.hpp"
#include "workload.hpp"

namespace rscache {

struct BenchmarkReport {
    size_t array_size{};
    size_t queries{};
    size_t cache_capacity{};

    double uncached_seconds{};
    double cached_seconds{};
    int64_t uncached_checksum{};
    int64_t cached_checksum{};

    CacheStats stats{};
    size_t final_cache_size{};

    double Speedup() const { return cached_seconds > 0 ? uncached_seconds / cached_seconds : 0; }
    double HitRate() const {
        auto lookups = stats.hits + stats.misses;
        return lookups ? static_cast<double>(stats.hits) / lookups : 0;
    }
};

// Replays the queries against any store with RangeSum and Update. Returns the
// wrapping sum of all range results, so two runs can be compared.
template <class Store>
int64_t ReplayQueries(Store& store, const std::vector<Query>& queries) {
    uint64_t checksum = 0;
    for (const auto& q : queries) {
        if (q.kind == QueryKind::kRange) {
            checksum += static_cast<uint64_t>(store.RangeSum(q.left, q.right));
        } else {
            store.Update(q.left, q.value);
        }
    }
    return static_cast<int64_t>(checksum);
}

// Runs one workload through the uncached baseline and the cached store,
// each on its own copy of the initial array.
BenchmarkReport RunBenchmark(const BenchmarkConfig& config);

nlohmann::json ReportToJson(const BenchmarkReport& report);

}  // namespace rscache
