#include "fedrelay/submission.hpp"
#include "fedrelay/codec.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

namespace fedrelay {

SubmissionService::SubmissionService(std::shared_ptr<PersistenceCoordinator> coordinator,
                                     std::shared_ptr<NoiseCalibrator> calibrator)
    : coordinator_(std::move(coordinator)), calibrator_(std::move(calibrator)) {
    FEDRELAY_CHECK_ARGUMENT(coordinator_ != nullptr, "A persistence coordinator is required");
    if (!calibrator_) {
        calibrator_ = std::make_shared<NoiseCalibrator>();
    }
}

SubmitResult SubmissionService::submit_update(const std::string& model_id, int64_t round,
                                              const std::string& contributor_id,
                                              const Bytes& weight_bytes,
                                              const std::optional<PrivacyParameters>& privacy,
                                              const CancellationToken* cancel) {
    FEDRELAY_CHECK_ARGUMENT(!model_id.empty(), "model_id must not be empty");
    FEDRELAY_CHECK_ARGUMENT(!contributor_id.empty(), "contributor_id must not be empty");
    FEDRELAY_CHECK_ARGUMENT(round >= 1, "round must be >= 1, got " + std::to_string(round));

    // Reject bad parameters before touching the payload.
    if (privacy) {
        privacy->validate();
    }

    ModelUpdate update;
    update.contributor_id = contributor_id;
    update.weights = codec::decode_weights(weight_bytes);
    update.round = round;
    update.submitted_at = Clock::now();

    if (privacy) {
        LOG_INFO("Applying differential privacy to update from {} (epsilon={}, delta={}, clip={})",
                 contributor_id, privacy->epsilon, privacy->delta, privacy->l2_norm_clip);
        update.weights = calibrator_->apply_privacy(update.weights, *privacy);
    }

    SubmitResult result;
    result.location = coordinator_->merge_update(model_id, update, privacy, cancel);
    return result;
}

} // namespace fedrelay
