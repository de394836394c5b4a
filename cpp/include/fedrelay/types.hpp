/**
 * Core data model for the federated aggregation engine.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/json.hpp>

namespace fedrelay {

// Flattened model weights. All vectors in one merge or privacy operation
// must share a length; empty vectors are rejected.
using WeightVector = std::vector<float>;

// Raw wire payload (see codec.hpp).
using Bytes = std::vector<uint8_t>;

using Clock = std::chrono::system_clock;

/**
 * Differential privacy parameters for one invocation of the Gaussian
 * mechanism. Never persisted alongside raw weights.
 */
struct PrivacyParameters {
    double epsilon = 1.0;        // privacy budget, > 0
    double delta = 1e-5;         // failure probability, in (0,1)
    double l2_norm_clip = 1.0;   // clipping threshold, > 0
    double sample_rate = 0.01;   // training data sampling rate, in (0,1]

    // Throws InvalidParameterError naming the first offending field.
    void validate() const;
};

struct PrivacyCost {
    double epsilon = 0.0;
    double delta = 0.0;
};

// One contributor's submission. Consumed exactly once by the merge step.
struct ModelUpdate {
    std::string contributor_id;
    WeightVector weights;
    int64_t round = 1;
    Clock::time_point submitted_at = Clock::now();
};

// Shared model state as held by the external store.
struct GlobalModelState {
    WeightVector weights;
    int64_t round = 0;
    Clock::time_point updated_at{};
};

/**
 * Append-only audit entry, one per successful aggregation.
 * Serialized as {timestamp, id, modelName, numUpdates, contributorIds, round, config}.
 */
struct AggregationRecord {
    std::string timestamp;
    std::string id;
    std::string model_name;
    size_t num_updates = 0;
    std::vector<std::string> contributor_ids;
    int64_t round = 0;
    boost::json::object config;

    boost::json::object to_json() const;
};

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-18T09:12:44.123Z
std::string format_timestamp(Clock::time_point tp);

} // namespace fedrelay
