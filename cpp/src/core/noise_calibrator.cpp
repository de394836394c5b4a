/**
 * Noise Calibrator Implementation
 *
 * Norms and scaling go through Eigen maps over the weight buffer; the norm is
 * accumulated in double so large models do not lose precision.
 */

#include "fedrelay/noise_calibrator.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace fedrelay {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

Eigen::Map<const Eigen::VectorXf> as_eigen(const WeightVector& v) {
    return Eigen::Map<const Eigen::VectorXf>(v.data(), static_cast<Eigen::Index>(v.size()));
}

} // namespace

NoiseCalibrator::NoiseCalibrator() : source_(SecureRandom::instance()) {}

NoiseCalibrator::NoiseCalibrator(UniformSource& source) : source_(source) {}

// =============================================================================
// Pure helpers
// =============================================================================

double NoiseCalibrator::l2_norm(const WeightVector& weights) {
    return as_eigen(weights).cast<double>().norm();
}

WeightVector NoiseCalibrator::clip_weights(const WeightVector& weights, double clip) {
    FEDRELAY_CHECK_ARGUMENT(!weights.empty(), "Cannot clip an empty weight vector");
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(clip) && clip > 0.0,
                            "l2_norm_clip must be > 0, got " + std::to_string(clip));

    const double norm = l2_norm(weights);
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(norm), "Weight vector contains non-finite values");

    LOG_DEBUG("Original weights L2 norm: {:.4f}", norm);
    if (norm <= clip) {
        LOG_DEBUG("No clipping necessary, norm within threshold {:.4f}", clip);
        return weights;
    }

    const double scale = clip / norm;
    WeightVector clipped(weights.size());
    Eigen::Map<Eigen::VectorXf> out(clipped.data(), static_cast<Eigen::Index>(clipped.size()));
    out = (as_eigen(weights).cast<double>() * scale).cast<float>();

    LOG_DEBUG("Weights clipped with scale factor {:.4f}", scale);
    return clipped;
}

double NoiseCalibrator::noise_scale(double epsilon, double delta, double sensitivity) {
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(epsilon) && epsilon > 0.0,
                            "epsilon must be > 0, got " + std::to_string(epsilon));
    FEDRELAY_CHECK_ARGUMENT(delta > 0.0 && delta < 1.0,
                            "delta must be in (0,1), got " + std::to_string(delta));
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(sensitivity) && sensitivity > 0.0,
                            "sensitivity must be > 0, got " + std::to_string(sensitivity));

    const double c = std::sqrt(2.0 * std::log(1.25 / delta));
    return c * sensitivity / epsilon;
}

PrivacyCost NoiseCalibrator::estimate_privacy_cost(double epsilon, double delta,
                                                   int64_t iterations, double sample_rate) {
    FEDRELAY_CHECK_ARGUMENT(std::isfinite(epsilon) && epsilon > 0.0,
                            "epsilon must be > 0, got " + std::to_string(epsilon));
    FEDRELAY_CHECK_ARGUMENT(delta > 0.0 && delta < 1.0,
                            "delta must be in (0,1), got " + std::to_string(delta));
    FEDRELAY_CHECK_ARGUMENT(iterations >= 0,
                            "iterations must be >= 0, got " + std::to_string(iterations));
    FEDRELAY_CHECK_ARGUMENT(sample_rate > 0.0 && sample_rate <= 1.0,
                            "sample_rate must be in (0,1], got " + std::to_string(sample_rate));

    const double amplification = std::sqrt(std::log(1.0 / delta) *
                                           static_cast<double>(iterations) * sample_rate);
    return PrivacyCost{epsilon * amplification, delta};
}

// =============================================================================
// Noise generation
// =============================================================================

WeightVector NoiseCalibrator::gaussian_noise(size_t size, double std_dev) {
    WeightVector noise(size);

    for (size_t i = 0; i < size; i += 2) {
        const double u1 = source_.uniform_open();
        const double u2 = source_.uniform_open();

        const double radius = std::sqrt(-2.0 * std::log(u1));
        const double theta = kTwoPi * u2;

        noise[i] = static_cast<float>(radius * std::cos(theta) * std_dev);
        if (i + 1 < size) {
            noise[i + 1] = static_cast<float>(radius * std::sin(theta) * std_dev);
        }
    }

    return noise;
}

WeightVector NoiseCalibrator::apply_privacy(const WeightVector& weights, const PrivacyParameters& params) {
    params.validate();
    FEDRELAY_CHECK_ARGUMENT(!weights.empty(), "Cannot apply privacy to an empty weight vector");

    LOG_INFO("Applying differential privacy: epsilon={} delta={} l2_clip={} sample_rate={}",
             params.epsilon, params.delta, params.l2_norm_clip, params.sample_rate);

    WeightVector clipped = clip_weights(weights, params.l2_norm_clip);
    const double sens = sensitivity(params.l2_norm_clip);
    const double std_dev = noise_scale(params.epsilon, params.delta, sens);
    LOG_DEBUG("Calculated noise scale (std dev): {:.4f}", std_dev);

    WeightVector noise = gaussian_noise(clipped.size(), std_dev);

    Eigen::Map<Eigen::VectorXf> out(clipped.data(), static_cast<Eigen::Index>(clipped.size()));
    out += as_eigen(noise);
    return clipped;
}

} // namespace fedrelay
