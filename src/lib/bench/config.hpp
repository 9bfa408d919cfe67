#pragma once
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "workload.hpp"

namespace rscache {

class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& what) : std::runtime_error{what} {}
};

struct BenchmarkConfig {
    WorkloadParams workload;
    size_t cache_capacity{1'000};
    // Empty means no report file.
    std::string report_path;
};

// Reads {"input": {...}, "params": {...}, "output": {...}}. Absent keys keep
// their defaults.
BenchmarkConfig ParseBenchmarkConfig(const nlohmann::json& j);

BenchmarkConfig LoadBenchmarkConfig(const std::string& path);

void ValidateBenchmarkConfig(const BenchmarkConfig& config);

}  // namespace rscache
