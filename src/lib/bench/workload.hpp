#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace rscache {

struct WorkloadParams {
    size_t array_size{100'000};
    int64_t value_min{1};
    int64_t value_max{100};
    uint64_t seed{42};

    size_t queries{50'000};
    size_t hot_pool{30};
    double p_hot{.95};
    double p_update{.03};
    int64_t update_min{1};
    int64_t update_max{100};
};

enum class QueryKind { kRange, kUpdate };

struct Query {
    QueryKind kind;
    ptrdiff_t left;   // index for updates
    ptrdiff_t right;  // unused for updates
    int64_t value;    // unused for range queries

    static Query Range(ptrdiff_t l, ptrdiff_t r) { return {QueryKind::kRange, l, r, 0}; }
    static Query Update(ptrdiff_t index, int64_t value) {
        return {QueryKind::kUpdate, index, index, value};
    }
};

bool operator==(const Query& a, const Query& b);

// Synthetic mix of point updates and range queries that keeps hitting a small
// pool of hot intervals. Same params (seed included) give the same workload.
class WorkloadGenerator {
   public:
    explicit WorkloadGenerator(const WorkloadParams& params);

    std::vector<int64_t> MakeArray();

    std::vector<Query> MakeQueries();

   private:
    ptrdiff_t RandomIndex(ptrdiff_t lo, ptrdiff_t hi);

    WorkloadParams params_;
    std::mt19937_64 rng_;
};

}  // namespace rscache
