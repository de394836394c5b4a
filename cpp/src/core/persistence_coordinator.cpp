#include "fedrelay/persistence_coordinator.hpp"
#include "fedrelay/codec.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"
#include "fedrelay/secure_random.hpp"

#include <spdlog/fmt/fmt.h>

namespace fedrelay {

store::Headers privacy_headers(const std::optional<PrivacyParameters>& privacy) {
    store::Headers headers;
    headers["X-Privacy-Applied"] = privacy ? "true" : "false";
    if (privacy) {
        headers["X-Privacy-Epsilon"] = fmt::format("{}", privacy->epsilon);
        headers["X-Privacy-Delta"] = fmt::format("{}", privacy->delta);
        headers["X-Privacy-L2-Clip"] = fmt::format("{}", privacy->l2_norm_clip);
    }
    return headers;
}

PersistenceCoordinator::PersistenceCoordinator(std::shared_ptr<store::ModelStore> store,
                                               CoordinatorOptions options,
                                               AggregationEngine engine,
                                               std::shared_ptr<HistorySink> history,
                                               std::shared_ptr<BackupWriter> backups)
    : store_(std::move(store)),
      options_(std::move(options)),
      engine_(engine),
      history_(std::move(history)),
      backups_(std::move(backups)) {
    FEDRELAY_CHECK_ARGUMENT(store_ != nullptr, "A model store is required");
    FEDRELAY_CHECK_ARGUMENT(options_.learning_rate > 0.0 && options_.learning_rate <= 1.0,
                            "learning_rate must be in (0, 1], got " + std::to_string(options_.learning_rate));
    FEDRELAY_CHECK_ARGUMENT(options_.retry.max_attempts >= 1,
                            "max retries must be >= 1, got " + std::to_string(options_.retry.max_attempts));
    if (!options_.sleeper) {
        options_.sleeper = default_sleeper;
    }
}

// =============================================================================
// Update path
// =============================================================================

std::string PersistenceCoordinator::process_update(const std::string& model_id, int64_t round,
                                                   const Bytes& raw_update,
                                                   const UpdateMetadata& metadata,
                                                   const CancellationToken* cancel) {
    FEDRELAY_CHECK_ARGUMENT(round >= 1, "round must be >= 1, got " + std::to_string(round));

    ModelUpdate update;
    update.contributor_id = metadata.contributor_id;
    update.weights = codec::decode_weights(raw_update);
    update.round = round;
    return merge_update(model_id, update, metadata.privacy, cancel);
}

std::string PersistenceCoordinator::merge_update(const std::string& model_id, const ModelUpdate& update,
                                                 const std::optional<PrivacyParameters>& privacy,
                                                 const CancellationToken* cancel) {
    FEDRELAY_CHECK_ARGUMENT(update.round >= 1, "round must be >= 1, got " + std::to_string(update.round));
    const std::string key = store::model_key(model_id);

    std::optional<CancellationToken> deadline;
    if (!cancel && options_.persist_deadline.count() > 0) {
        deadline.emplace(CancellationToken::SteadyClock::now() + options_.persist_deadline);
        cancel = &*deadline;
    }

    LOG_INFO("Processing update for model {} round {} from {} ({} weights)",
             model_id, update.round, update.contributor_id.empty() ? "<anonymous>" : update.contributor_id,
             update.weights.size());

    KeyedMutex::Guard guard(key_locks_, key, cancel);
    if (cancel && cancel->is_cancelled()) {
        throw CancelledError("Update for " + model_id + " cancelled before fetching the baseline",
                             "process_update");
    }

    const std::optional<WeightVector> baseline = fetch_baseline(model_id, key);

    GlobalModelState state;
    state.weights = engine_.merge({update.weights}, baseline, options_.learning_rate);
    state.round = update.round;
    LOG_INFO("Merged update for model {} ({})", model_id,
             baseline ? "async FedAvg with existing global model" : "first contribution");

    store::Headers extra = privacy_headers(privacy);
    if (!update.contributor_id.empty()) {
        extra["X-Contributor-Id"] = update.contributor_id;
    }

    PersistOutcome outcome = save_global_model(model_id, update.round, codec::encode_weights(state.weights),
                                               1, extra, cancel);
    state.updated_at = Clock::now();
    record_history(model_id, update, state, baseline.has_value(), privacy.has_value());
    return outcome.location;
}

std::optional<WeightVector> PersistenceCoordinator::fetch_baseline(const std::string& model_id,
                                                                   const std::string& key) {
    store::FetchResult fetched;
    try {
        fetched = store_->get(key);
    } catch (const StorageReadError& e) {
        LOG_WARN("Could not read global model for {}, proceeding without baseline: {}", model_id, e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_WARN("Unexpected error reading global model for {}, proceeding without baseline: {}",
                 model_id, e.what());
        return std::nullopt;
    }

    if (!fetched.found() || fetched.bytes.empty()) {
        LOG_INFO("No existing global model for {} (status {}), this is the first contribution",
                 model_id, fetched.http_status);
        return std::nullopt;
    }

    try {
        WeightVector weights = codec::decode_weights(fetched.bytes);
        LOG_INFO("Fetched existing global model for {} ({} weights)", model_id, weights.size());
        return weights;
    } catch (const WireFormatError& e) {
        LOG_WARN("Stored global model for {} is not a valid payload, ignoring it: {}", model_id, e.what());
        return std::nullopt;
    }
}

// =============================================================================
// Persist
// =============================================================================

PersistOutcome PersistenceCoordinator::save_global_model(const std::string& model_id, int64_t round,
                                                         const Bytes& bytes, size_t updates_count,
                                                         const store::Headers& extra_headers,
                                                         const CancellationToken* cancel) {
    const std::string key = store::model_key(model_id);

    store::Headers headers = extra_headers;
    headers["Content-Type"] = "application/octet-stream";
    headers["X-Aggregation-Round"] = std::to_string(round);
    headers["X-Aggregation-Type"] = "fedavg";
    headers["X-Updates-Count"] = std::to_string(updates_count);
    headers["X-Async-Update"] = "true";
    headers["X-Timestamp"] = format_timestamp(Clock::now());

    const int max_attempts = options_.retry.max_attempts;
    PersistOutcome outcome;

    auto attempt_put = [&](int attempt) {
        LOG_INFO("Saving global model {} round {} to {} (attempt {}/{})",
                 model_id, round, store_->describe(), attempt, max_attempts);
        store::PutResult result = store_->put(key, bytes, headers);
        if (!result.ok) {
            throw FedRelayException(ErrorCode::STORAGE_WRITE_FAILURE,
                                    "status " + std::to_string(result.status) + ": " + result.message,
                                    key);
        }
        outcome.location = result.location;
    };

    auto on_failure = [&](int attempt, const std::string& error) {
        LOG_ERROR("Attempt {}/{} to save global model {} failed: {}", attempt, max_attempts, model_id, error);
        if (attempt < max_attempts && options_.retry.delay) {
            LOG_INFO("Waiting {} ms before retrying", options_.retry.delay(attempt).count());
        }
    };

    try {
        outcome.attempts = retry_with_backoff(options_.retry, attempt_put, cancel, options_.sleeper, on_failure);
    } catch (const RetryExhaustedError& e) {
        LOG_ERROR("Giving up on global model {} round {} after {} attempts", model_id, round, e.attempts());
        throw StorageWriteError(model_id, round, e.attempts(), e.last_error());
    } catch (const CancelledError& e) {
        LOG_WARN("Save of global model {} round {} cancelled, previous state remains current: {}",
                 model_id, round, e.what());
        throw;
    }

    LOG_INFO("Saved global model {} round {} to {}", model_id, round, outcome.location);
    return outcome;
}

// =============================================================================
// Audit and backup
// =============================================================================

void PersistenceCoordinator::record_history(const std::string& model_id, const ModelUpdate& update,
                                            const GlobalModelState& written, bool had_baseline,
                                            bool privacy_applied) {
    if (history_) {
        try {
            AggregationRecord record;
            record.timestamp = format_timestamp(written.updated_at);
            record.id = SecureRandom::instance().hex_id(4);
            record.model_name = model_id;
            record.num_updates = 1;
            if (!update.contributor_id.empty()) {
                record.contributor_ids.push_back(update.contributor_id);
            }
            record.round = written.round;
            record.config["learningRate"] = options_.learning_rate;
            record.config["maxRetries"] = options_.retry.max_attempts;
            record.config["isAsyncUpdate"] = true;
            record.config["currentGlobalModel"] = had_baseline ? "present" : "absent";
            record.config["baselineMismatch"] = baseline_mismatch_policy_name(engine_.policy());
            record.config["privacyApplied"] = privacy_applied;
            record.config["submittedAt"] = format_timestamp(update.submitted_at);
            history_->append(record);
        } catch (const HistoryLogError& e) {
            LOG_WARN("Failed to save aggregation history for {}: {}", model_id, e.what());
        } catch (const std::exception& e) {
            LOG_WARN("Unexpected error saving aggregation history for {}: {}", model_id, e.what());
        }
    }

    if (backups_) {
        try {
            backups_->write(model_id, written.round, codec::encode_weights(written.weights));
        } catch (const HistoryLogError& e) {
            LOG_WARN("Failed to save model backup for {}: {}", model_id, e.what());
        } catch (const std::exception& e) {
            LOG_WARN("Unexpected error saving model backup for {}: {}", model_id, e.what());
        }
    }
}

} // namespace fedrelay
