#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include <bench/config.hpp>
#include <bench/runner.hpp>

#include <nlohmann/json.hpp>

using namespace rscache;
using json = nlohmann::json;

TEST_CASE("Benchmark config parsing") {
    SECTION("Empty document keeps the defaults") {
        auto config = ParseBenchmarkConfig(json::object());
        REQUIRE(config.workload.array_size == 100'000);
        REQUIRE(config.workload.queries == 50'000);
        REQUIRE(config.cache_capacity == 1'000);
        REQUIRE(config.workload.hot_pool == 30);
        REQUIRE(config.workload.p_hot == Approx(.95));
        REQUIRE(config.workload.p_update == Approx(.03));
        REQUIRE(config.report_path.empty());
    }

    SECTION("Sections override the defaults") {
        auto j = json::parse(R"({
            "input": {"array_size": 10, "seed": 3, "value_min": -5, "value_max": 5},
            "params": {"queries": 100, "cache_capacity": 4, "p_update": 0.5},
            "output": {"path": "report.json"}
        })");
        auto config = ParseBenchmarkConfig(j);
        REQUIRE(config.workload.array_size == 10);
        REQUIRE(config.workload.seed == 3);
        REQUIRE(config.workload.value_min == -5);
        REQUIRE(config.workload.queries == 100);
        REQUIRE(config.cache_capacity == 4);
        REQUIRE(config.workload.p_update == Approx(.5));
        REQUIRE(config.workload.p_hot == Approx(.95));
        REQUIRE(config.report_path == "report.json");
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"params": {"cache_capacity": 0}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"params": {"p_hot": 1.5}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"input": {"array_size": "big"}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"input": 5})")), ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse("[]")), ConfigError);
    }

    SECTION("Negative counts are rejected") {
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"params": {"cache_capacity": -1}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"input": {"array_size": -5}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"params": {"queries": -1}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"params": {"hot_pool": -1}})")),
                          ConfigError);
        REQUIRE_THROWS_AS(ParseBenchmarkConfig(json::parse(R"({"input": {"seed": -1.5}})")),
                          ConfigError);
        REQUIRE(ParseBenchmarkConfig(json::parse(R"({"params": {"hot_pool": 0}})"))
                    .workload.hot_pool == 0);
        REQUIRE(ParseBenchmarkConfig(json::parse(R"({"input": {"value_min": -5}})"))
                    .workload.value_min == -5);
    }

    SECTION("Missing file is a config error") {
        REQUIRE_THROWS_AS(LoadBenchmarkConfig("does/not/exist.json"), ConfigError);
    }

    SECTION("Config is read from a file") {
        const std::string path = "rscache_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"params": {"queries": 7}})";
        }
        auto queries = LoadBenchmarkConfig(path).workload.queries;
        std::remove(path.c_str());
        REQUIRE(queries == 7);
    }
}

TEST_CASE("Benchmark runs agree between cached and uncached stores") {
    BenchmarkConfig config;
    config.workload.array_size = 2'000;
    config.workload.queries = 3'000;
    config.workload.p_update = .1;
    config.cache_capacity = 50;

    auto report = RunBenchmark(config);
    REQUIRE(report.uncached_checksum == report.cached_checksum);
    REQUIRE(report.stats.hits + report.stats.misses < config.workload.queries);
    REQUIRE(report.stats.hits > 0);
    REQUIRE(report.stats.invalidations > 0);
    REQUIRE(report.final_cache_size <= 50);

    auto j = ReportToJson(report);
    REQUIRE(j["checksums_match"].get<bool>());
    REQUIRE(j["cache"]["final_size"].get<size_t>() == report.final_cache_size);
}
