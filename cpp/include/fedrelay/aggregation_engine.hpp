/**
 * Aggregation Engine - asynchronous FedAvg merge
 *
 *   avg      = elementwise mean of all updates (equal weight per contributor)
 *   result   = avg                                       if no baseline
 *   result_i = (1 - lr) * baseline_i + lr * avg_i        otherwise
 *
 * Equal weighting ignores per-contributor dataset size. That is the
 * aggregation policy, not size-weighted FedAvg.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fedrelay/types.hpp"

namespace fedrelay {

// What to do when a baseline's length differs from the updates'.
enum class BaselineMismatchPolicy {
    Fail,            // throw ShapeMismatchError
    IgnoreBaseline   // warn and fall back to the plain average
};

const char* baseline_mismatch_policy_name(BaselineMismatchPolicy policy);
// Accepts "fail" and "ignore_baseline"; throws InvalidParameterError otherwise.
BaselineMismatchPolicy parse_baseline_mismatch_policy(const std::string& name);

class AggregationEngine {
public:
    explicit AggregationEngine(BaselineMismatchPolicy policy = BaselineMismatchPolicy::Fail)
        : policy_(policy) {}

    /**
     * Merge updates into an optional baseline. Pure given its inputs.
     * Throws NoUpdatesError for an empty update list, ShapeMismatchError for
     * unequal lengths, InvalidParameterError for learning_rate outside [0,1]
     * or empty vectors.
     */
    WeightVector merge(const std::vector<WeightVector>& updates,
                       const std::optional<WeightVector>& baseline,
                       double learning_rate) const;

    // Elementwise arithmetic mean; same preconditions as merge().
    static WeightVector elementwise_mean(const std::vector<WeightVector>& updates);

    BaselineMismatchPolicy policy() const { return policy_; }

private:
    BaselineMismatchPolicy policy_;
};

} // namespace fedrelay
