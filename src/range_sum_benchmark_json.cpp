#include <fstream>
#include <iomanip>
#include <iostream>

#include <bench/config.hpp>
#include <bench/runner.hpp>

#include <nlohmann/json.hpp>

using namespace rscache;

int main(int argc, char** argv) {
    BenchmarkConfig config;
    try {
        if (argc > 1) {
            config = LoadBenchmarkConfig(argv[1]);
        }
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    BenchmarkReport report;
    try {
        report = RunBenchmark(config);
    } catch (const std::exception& e) {
        std::cerr << "benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\nResults" << std::endl;
    std::cout << "No cache : " << std::setw(6) << report.uncached_seconds << " s" << std::endl;
    std::cout << "LRU cache: " << std::setw(6) << report.cached_seconds << " s";
    if (report.cached_seconds > 0) {
        std::cout << "  (speedup x" << std::setprecision(1) << report.Speedup() << ")";
    }
    std::cout << std::endl;
    std::cout << std::setprecision(3) << "hit rate = " << report.HitRate()
              << ", invalidations = " << report.stats.invalidations
              << ", cached intervals = " << report.final_cache_size << std::endl;

    if (report.uncached_checksum != report.cached_checksum) {
        std::cerr << "cached and uncached runs disagree: " << report.uncached_checksum << " vs "
                  << report.cached_checksum << std::endl;
        return 2;
    }

    if (!config.report_path.empty()) {
        std::ofstream out(config.report_path);
        if (!out) {
            std::cerr << "cannot write report to " << config.report_path << std::endl;
            return 1;
        }
        out << std::setw(4) << ReportToJson(report) << std::endl;
    }
    return 0;
}
