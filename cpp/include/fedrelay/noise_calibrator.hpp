/**
 * Noise Calibrator - Gaussian mechanism for contributor updates
 *
 * Clips an update to a maximum L2 norm, derives the noise scale from the
 * privacy parameters, and adds i.i.d. Gaussian noise drawn from a
 * cryptographically secure source. Runs on the contributor side before
 * submission; the merge path never calls it.
 */

#pragma once

#include <cstdint>

#include "fedrelay/secure_random.hpp"
#include "fedrelay/types.hpp"

namespace fedrelay {

class NoiseCalibrator {
public:
    // Uses the process-wide SecureRandom.
    NoiseCalibrator();

    // Source must outlive the calibrator. Tests inject deterministic draws here.
    explicit NoiseCalibrator(UniformSource& source);

    /**
     * Clip -> sensitivity -> noise scale -> Box-Muller noise -> inject.
     * Throws InvalidParameterError for epsilon <= 0, delta outside (0,1),
     * l2_norm_clip <= 0, sample_rate outside (0,1], or empty weights.
     */
    WeightVector apply_privacy(const WeightVector& weights, const PrivacyParameters& params);

    /**
     * Generate `size` independent N(0, std_dev^2) samples.
     * Consumes two uniform draws per pair of outputs; for odd sizes the
     * second half of the final pair is discarded.
     */
    WeightVector gaussian_noise(size_t size, double std_dev);

    // ---- Pure helpers -------------------------------------------------------

    static double l2_norm(const WeightVector& weights);

    // Scales weights down to norm `clip` when their norm exceeds it, otherwise
    // returns them unchanged (bit-for-bit).
    static WeightVector clip_weights(const WeightVector& weights, double clip);

    // Maximum change one clipped update can cause.
    static double sensitivity(double l2_norm_clip) { return l2_norm_clip; }

    // sqrt(2 ln(1.25/delta)) * sensitivity / epsilon
    static double noise_scale(double epsilon, double delta, double sensitivity);

    /**
     * Heuristic composed privacy cost over `iterations` rounds:
     *   epsilon_total = epsilon * sqrt(ln(1/delta) * iterations * sample_rate)
     *
     * This is an approximation for user-facing guidance only. It is not a
     * tight moments-accountant bound and is not a security guarantee.
     */
    static PrivacyCost estimate_privacy_cost(double epsilon, double delta,
                                             int64_t iterations, double sample_rate);

private:
    UniformSource& source_;
};

} // namespace fedrelay
