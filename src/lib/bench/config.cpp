#include "config.hpp"

#include <fstream>
#include <type_traits>

namespace rscache {

using json = nlohmann::json;

namespace {
template <class T>
void ReadOptional(const json& section, const char* key, T& out) {
    if (!section.contains(key)) return;
    const json& value = section.at(key);
    if constexpr (std::is_unsigned<T>::value) {
        if (value.is_number() && !value.is_number_unsigned() && value.get<double>() < 0) {
            throw ConfigError{std::string{"\""} + key + "\" should not be negative"};
        }
    }
    try {
        out = value.get<T>();
    } catch (const json::exception& e) {
        throw ConfigError{std::string{"bad value for \""} + key + "\": " + e.what()};
    }
}

const json& Section(const json& j, const char* name) {
    static const json kEmpty = json::object();
    if (!j.contains(name)) return kEmpty;
    const json& s = j.at(name);
    if (!s.is_object()) {
        throw ConfigError{std::string{"section \""} + name + "\" should be an object"};
    }
    return s;
}
}  // namespace

BenchmarkConfig ParseBenchmarkConfig(const json& j) {
    if (!j.is_object()) {
        throw ConfigError{"config root should be an object"};
    }

    BenchmarkConfig config;
    const json& input = Section(j, "input");
    const json& params = Section(j, "params");
    const json& output = Section(j, "output");

    ReadOptional(input, "array_size", config.workload.array_size);
    ReadOptional(input, "value_min", config.workload.value_min);
    ReadOptional(input, "value_max", config.workload.value_max);
    ReadOptional(input, "seed", config.workload.seed);

    ReadOptional(params, "queries", config.workload.queries);
    ReadOptional(params, "cache_capacity", config.cache_capacity);
    ReadOptional(params, "hot_pool", config.workload.hot_pool);
    ReadOptional(params, "p_hot", config.workload.p_hot);
    ReadOptional(params, "p_update", config.workload.p_update);
    ReadOptional(params, "update_min", config.workload.update_min);
    ReadOptional(params, "update_max", config.workload.update_max);

    ReadOptional(output, "path", config.report_path);

    ValidateBenchmarkConfig(config);
    return config;
}

BenchmarkConfig LoadBenchmarkConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigError{"cannot open config file " + path};
    }
    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::parse_error& e) {
        throw ConfigError{"cannot parse " + path + ": " + e.what()};
    }
    return ParseBenchmarkConfig(j);
}

void ValidateBenchmarkConfig(const BenchmarkConfig& config) {
    const auto& w = config.workload;
    if (w.array_size < 1) throw ConfigError{"input.array_size should be >= 1"};
    if (config.cache_capacity < 1) throw ConfigError{"params.cache_capacity should be >= 1"};
    if (w.value_min > w.value_max) throw ConfigError{"input.value_min > input.value_max"};
    if (w.update_min > w.update_max) throw ConfigError{"params.update_min > params.update_max"};
    if (w.p_hot < 0 || w.p_hot > 1) throw ConfigError{"params.p_hot should be in [0, 1]"};
    if (w.p_update < 0 || w.p_update > 1) throw ConfigError{"params.p_update should be in [0, 1]"};
}

}  // namespace rscache
