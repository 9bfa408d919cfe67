#include "runner.hpp"

#include <iostream>

#include <io/stopwatch.hpp>

namespace rscache {

BenchmarkReport RunBenchmark(const BenchmarkConfig& config) {
    ValidateBenchmarkConfig(config);

    WorkloadGenerator generator{config.workload};
    const auto master = generator.MakeArray();
    const auto queries = generator.MakeQueries();

    BenchmarkReport report;
    report.array_size = master.size();
    report.queries = queries.size();
    report.cache_capacity = config.cache_capacity;

    std::cout << "Array size (N): " << master.size() << std::endl;
    std::cout << "Queries (Q): " << queries.size() << std::endl;
    std::cout << "LRU capacity (K): " << config.cache_capacity << std::endl;

    {
        PlainSums<DefaultGroup<int64_t>> plain{master};
        Stopwatch sw{"uncached", &report.uncached_seconds};
        report.uncached_checksum = ReplayQueries(plain, queries);
    }

    {
        RangeSumStore store{master, config.cache_capacity};
        {
            Stopwatch sw{"lru cached", &report.cached_seconds};
            report.cached_checksum = ReplayQueries(store, queries);
        }
        report.stats = store.Stats();
        report.final_cache_size = store.CacheSize();
    }

    return report;
}

nlohmann::json ReportToJson(const BenchmarkReport& report) {
    nlohmann::json j;
    j["array_size"] = report.array_size;
    j["queries"] = report.queries;
    j["cache_capacity"] = report.cache_capacity;
    j["uncached_seconds"] = report.uncached_seconds;
    j["cached_seconds"] = report.cached_seconds;
    j["speedup"] = report.Speedup();
    j["checksums_match"] = report.uncached_checksum == report.cached_checksum;
    j["cache"]["hits"] = report.stats.hits;
    j["cache"]["misses"] = report.stats.misses;
    j["cache"]["hit_rate"] = report.HitRate();
    j["cache"]["invalidations"] = report.stats.invalidations;
    j["cache"]["final_size"] = report.final_cache_size;
    return j;
}

}  // namespace rscache
