#include "fedrelay/aggregation_engine.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace fedrelay {

namespace {

using ConstVecMap = Eigen::Map<const Eigen::VectorXf>;

ConstVecMap as_eigen(const WeightVector& v) {
    return ConstVecMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

void check_shapes(const std::vector<WeightVector>& updates) {
    if (updates.empty()) {
        throw NoUpdatesError("AggregationEngine");
    }
    const size_t n = updates.front().size();
    FEDRELAY_CHECK_ARGUMENT(n > 0, "Cannot merge empty weight vectors");

    for (size_t i = 1; i < updates.size(); ++i) {
        if (updates[i].size() != n) {
            throw ShapeMismatchError("Model update " + std::to_string(i) + " has size " +
                                     std::to_string(updates[i].size()) + ", expected " +
                                     std::to_string(n), "AggregationEngine");
        }
    }
}

} // namespace

const char* baseline_mismatch_policy_name(BaselineMismatchPolicy policy) {
    switch (policy) {
        case BaselineMismatchPolicy::Fail: return "fail";
        case BaselineMismatchPolicy::IgnoreBaseline: return "ignore_baseline";
    }
    return "fail";
}

BaselineMismatchPolicy parse_baseline_mismatch_policy(const std::string& name) {
    if (name == "fail") return BaselineMismatchPolicy::Fail;
    if (name == "ignore_baseline") return BaselineMismatchPolicy::IgnoreBaseline;
    throw InvalidParameterError("Unknown baseline mismatch policy '" + name + "'",
                                __func__, "Use 'fail' or 'ignore_baseline'");
}

WeightVector AggregationEngine::elementwise_mean(const std::vector<WeightVector>& updates) {
    check_shapes(updates);

    const size_t n = updates.front().size();
    // Accumulate in double, then narrow once.
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
    for (const auto& u : updates) {
        sum += as_eigen(u).cast<double>();
    }
    sum /= static_cast<double>(updates.size());

    WeightVector avg(n);
    Eigen::Map<Eigen::VectorXf>(avg.data(), static_cast<Eigen::Index>(n)) = sum.cast<float>();
    return avg;
}

WeightVector AggregationEngine::merge(const std::vector<WeightVector>& updates,
                                      const std::optional<WeightVector>& baseline,
                                      double learning_rate) const {
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(learning_rate) && learning_rate >= 0.0 && learning_rate <= 1.0,
                            "learning_rate must be in [0,1], got " + std::to_string(learning_rate));

    LOG_DEBUG("Aggregating {} update(s) using FedAvg", updates.size());
    WeightVector avg = elementwise_mean(updates);

    if (!baseline) {
        return avg;
    }

    if (baseline->size() != avg.size()) {
        if (policy_ == BaselineMismatchPolicy::IgnoreBaseline) {
            LOG_WARN("Global model size ({}) doesn't match updates ({}); ignoring baseline",
                     baseline->size(), avg.size());
            return avg;
        }
        throw ShapeMismatchError("Baseline has size " + std::to_string(baseline->size()) +
                                 ", updates have size " + std::to_string(avg.size()),
                                 "AggregationEngine");
    }

    // learning_rate == 0 must reproduce the baseline exactly
    if (learning_rate == 0.0) {
        return *baseline;
    }

    WeightVector result(avg.size());
    Eigen::Map<Eigen::VectorXf> out(result.data(), static_cast<Eigen::Index>(result.size()));
    out = ((1.0 - learning_rate) * as_eigen(*baseline).cast<double>() +
           learning_rate * as_eigen(avg).cast<double>()).cast<float>();

    LOG_DEBUG("Applied async update with learning rate {}", learning_rate);
    return result;
}

} // namespace fedrelay
