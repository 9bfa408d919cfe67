#include "workload.hpp"

#include <stdexcept>

namespace rscache {

bool operator==(const Query& a, const Query& b) {
    return a.kind == b.kind && a.left == b.left && a.right == b.right && a.value == b.value;
}

WorkloadGenerator::WorkloadGenerator(const WorkloadParams& params)
    : params_{params}, rng_{params.seed} {
    if (params_.array_size == 0) {
        throw std::invalid_argument{"workload needs a non-empty array"};
    }
    if (params_.value_min > params_.value_max || params_.update_min > params_.update_max) {
        throw std::invalid_argument{"workload value range is empty"};
    }
    if (params_.p_hot < 0 || params_.p_hot > 1 || params_.p_update < 0 || params_.p_update > 1) {
        throw std::invalid_argument{"workload probabilities should be in [0, 1]"};
    }
}

std::vector<int64_t> WorkloadGenerator::MakeArray() {
    std::uniform_int_distribution<int64_t> value(params_.value_min, params_.value_max);
    std::vector<int64_t> ret(params_.array_size);
    for (auto& x : ret) x = value(rng_);
    return ret;
}

std::vector<Query> WorkloadGenerator::MakeQueries() {
    const ptrdiff_t n = params_.array_size;

    std::vector<std::pair<ptrdiff_t, ptrdiff_t>> hot;
    for (size_t i = 0; i < params_.hot_pool; ++i) {
        auto l = RandomIndex(0, n / 2);
        auto r = RandomIndex(n / 2, n - 1);
        hot.emplace_back(l, r);
    }

    std::uniform_real_distribution<double> coin(0., 1.);
    std::uniform_int_distribution<int64_t> update_value(params_.update_min, params_.update_max);

    std::vector<Query> queries;
    queries.reserve(params_.queries);
    for (size_t i = 0; i < params_.queries; ++i) {
        if (coin(rng_) < params_.p_update) {
            auto idx = RandomIndex(0, n - 1);
            queries.push_back(Query::Update(idx, update_value(rng_)));
        } else if (!hot.empty() && coin(rng_) < params_.p_hot) {
            auto [l, r] = hot[RandomIndex(0, hot.size() - 1)];
            queries.push_back(Query::Range(l, r));
        } else {
            auto l = RandomIndex(0, n - 1);
            auto r = RandomIndex(l, n - 1);
            queries.push_back(Query::Range(l, r));
        }
    }
    return queries;
}

ptrdiff_t WorkloadGenerator::RandomIndex(ptrdiff_t lo, ptrdiff_t hi) {
    return std::uniform_int_distribution<ptrdiff_t>(lo, hi)(rng_);
}

}  // namespace rscache
