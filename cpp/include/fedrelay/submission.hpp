#pragma once

#include <memory>
#include <optional>
#include <string>

#include "fedrelay/noise_calibrator.hpp"
#include "fedrelay/persistence_coordinator.hpp"
#include "fedrelay/types.hpp"

namespace fedrelay {

struct SubmitResult {
    std::string location;
};

/**
 * Entry point for contributor submissions.
 *
 * Validates the request, privatizes the weights when privacy parameters are
 * given, and hands the update to the PersistenceCoordinator.
 */
class SubmissionService {
public:
    SubmissionService(std::shared_ptr<PersistenceCoordinator> coordinator,
                      std::shared_ptr<NoiseCalibrator> calibrator = nullptr);

    SubmitResult submit_update(const std::string& model_id, int64_t round,
                               const std::string& contributor_id, const Bytes& weight_bytes,
                               const std::optional<PrivacyParameters>& privacy = std::nullopt,
                               const CancellationToken* cancel = nullptr);

private:
    std::shared_ptr<PersistenceCoordinator> coordinator_;
    std::shared_ptr<NoiseCalibrator> calibrator_;
};

} // namespace fedrelay
