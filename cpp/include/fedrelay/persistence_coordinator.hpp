/**
 * Persistence Coordinator - fetch, merge, write back
 *
 *   Start -> FetchBaseline -> Merge -> Persist(attempt 1..max) -> Done | Failed
 *
 * The coordinator keeps no model state between calls; the store is the single
 * source of truth and is re-read on every update. Read-path failures degrade
 * to "no baseline". Write-path failures after the last attempt are the only
 * fatal outcome. Audit records and backups are written only after a successful
 * persist and never fail the call.
 *
 * Concurrent calls for the same model key are serialized through a per-key
 * mutex held across the whole fetch-merge-write sequence.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "fedrelay/aggregation_engine.hpp"
#include "fedrelay/history_log.hpp"
#include "fedrelay/key_lock.hpp"
#include "fedrelay/retry.hpp"
#include "fedrelay/store/model_store.hpp"
#include "fedrelay/types.hpp"

namespace fedrelay {

struct CoordinatorOptions {
    double learning_rate = 0.1;
    RetryPolicy retry;
    Sleeper sleeper = default_sleeper;
    // Applied when the caller passes no cancellation token. 0 = no deadline.
    Millis persist_deadline{0};
};

// Describes a contributor submission. The privacy parameters are forwarded
// as X-Privacy-* headers only; they are never stored with the weights.
struct UpdateMetadata {
    std::string contributor_id;
    std::optional<PrivacyParameters> privacy;
};

struct PersistOutcome {
    std::string location;
    int attempts = 0;
};

class PersistenceCoordinator {
public:
    /**
     * @param store   storage collaborator, required
     * @param history audit sink, may be null (no audit records)
     * @param backups local backup writer, may be null (no backups)
     */
    PersistenceCoordinator(std::shared_ptr<store::ModelStore> store,
                           CoordinatorOptions options = {},
                           AggregationEngine engine = AggregationEngine(),
                           std::shared_ptr<HistorySink> history = nullptr,
                           std::shared_ptr<BackupWriter> backups = nullptr);

    /**
     * Merge one raw update into the model's global state.
     *
     * @return storage location of the newly written global state
     * @throws WireFormatError if raw_update is not a float32 payload
     * @throws ShapeMismatchError if the baseline length differs and the engine policy is Fail
     * @throws StorageWriteError after every persist attempt failed
     * @throws CancelledError if cancelled or past the deadline; prior state stays authoritative
     */
    std::string process_update(const std::string& model_id, int64_t round,
                               const Bytes& raw_update, const UpdateMetadata& metadata,
                               const CancellationToken* cancel = nullptr);

    // Same as process_update for an already decoded update.
    std::string merge_update(const std::string& model_id, const ModelUpdate& update,
                             const std::optional<PrivacyParameters>& privacy = std::nullopt,
                             const CancellationToken* cancel = nullptr);

    /**
     * Persist already-merged bytes with the aggregation headers and retry policy.
     * Does not take the per-key lock and writes no audit record.
     *
     * @throws StorageWriteError after every attempt failed
     * @throws CancelledError if cancelled before an attempt or while waiting
     */
    PersistOutcome save_global_model(const std::string& model_id, int64_t round,
                                     const Bytes& bytes, size_t updates_count,
                                     const store::Headers& extra_headers = {},
                                     const CancellationToken* cancel = nullptr);

    const CoordinatorOptions& options() const { return options_; }

private:
    // Baseline weights, or nullopt when absent, unreadable or undecodable.
    std::optional<WeightVector> fetch_baseline(const std::string& model_id, const std::string& key);

    void record_history(const std::string& model_id, const ModelUpdate& update,
                        const GlobalModelState& written, bool had_baseline, bool privacy_applied);

    std::shared_ptr<store::ModelStore> store_;
    CoordinatorOptions options_;
    AggregationEngine engine_;
    std::shared_ptr<HistorySink> history_;
    std::shared_ptr<BackupWriter> backups_;
    KeyedMutex key_locks_;
};

// X-Privacy-* headers describing how an update was privatized.
store::Headers privacy_headers(const std::optional<PrivacyParameters>& privacy);

} // namespace fedrelay
