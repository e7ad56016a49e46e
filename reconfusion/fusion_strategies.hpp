// fusion_strategies.hpp
#ifndef RECONFUSION_FUSION_STRATEGIES_HPP_
#define RECONFUSION_FUSION_STRATEGIES_HPP_

// Standard Library Headers
#include <algorithm> // For std::clamp, std::max
#include <cmath>     // For std::sqrt
#include <map>
#include <stdexcept> // For std::runtime_error
#include <string>
#include <utility>   // For std::pair
#include <vector>

// Eigen Library Headers
#include <Eigen/Dense>

// Project-specific Headers
#include "common_types.hpp"
#include "fusion_config.hpp"

namespace reconfusion {

/**
 * @brief Capability interface every fusion strategy implements.
 *
 * A strategy receives the already time-gated measurements of one tick and
 * returns the fused estimate together with its epistemic confidence and
 * surprise. Strategies never mutate run state.
 */
class FusionStrategy {
public:
    virtual ~FusionStrategy() = default;

    /**
     * @brief Fuses the given measurements into one estimate.
     * @param measurements Time-gated measurements for the current tick.
     */
    virtual FusedEstimate fuse(const std::vector<SensorMeasurement>& measurements) const = 0;

    /**
     * @brief Confidence and surprise of a fused position.
     * @param measurements The measurements that contributed to the fused position.
     * @param weights Normalized weights, one per measurement.
     * @param fused The fused [lat, lon, alt].
     * @return (fusion_conf, surprise), both in [0,1].
     */
    virtual std::pair<double, double> calculateConfidence(const std::vector<SensorMeasurement>& measurements,
                                                          const Eigen::VectorXd& weights,
                                                          const Eigen::Vector3d& fused) const = 0;

    virtual const char* getName() const = 0;

    /**
     * @brief The position-capable, non-dropped subset a strategy may fuse.
     */
    static std::vector<SensorMeasurement> positionMeasurements(const std::vector<SensorMeasurement>& measurements) {
        std::vector<SensorMeasurement> out;
        for (const auto& m : measurements) {
            if (!m.dropped() && isPositionType(m.sensorType())) {
                out.push_back(m);
            }
        }
        return out;
    }
};

/**
 * @brief Deterministic weighted-average position fusion.
 *
 * Each measurement's weight is the product of
 * - inverse covariance trace,
 * - a latency penalty 1 / (1 + latency_ms / 200),
 * - measurement quality clipped to [0,1],
 * - the sensor-type prior from FusionConfig (0.5 for unknown types).
 *
 * Only position is fused. Velocity and heading stay 0 under this strategy.
 */
class WeightedFusion : public FusionStrategy {
public:
    static constexpr double kMinCovarianceTrace = 1e-9;
    static constexpr double kMinWeightSum = 1e-12;
    static constexpr double kLatencyScaleMs = 200.0;

    // Per-axis scales that make lat/lon degrees and altitude metres comparable
    static constexpr double kLatLonScale = 1e-3;
    static constexpr double kAltitudeScale = 10.0;

    explicit WeightedFusion(const FusionConfig& config) : config_(config) {}

    /**
     * @brief Raw (unnormalized) weight of a single measurement, clamped to >= 0.
     */
    double weight(const SensorMeasurement& m) const {
        double cov_term = 1.0 / std::max(m.R().trace(), kMinCovarianceTrace);
        double latency_term = 1.0 / (1.0 + m.latencyMs() / kLatencyScaleMs);
        double quality_term = std::clamp(m.quality(), 0.0, 1.0);
        double type_weight = config_.positionWeight(toString(m.sensorType()));
        return std::max(0.0, cov_term * latency_term * quality_term * type_weight);
    }

    FusedEstimate fuse(const std::vector<SensorMeasurement>& measurements) const override {
        std::vector<SensorMeasurement> pos_meas = positionMeasurements(measurements);
        if (pos_meas.empty()) {
            return fallback();
        }

        const int n = static_cast<int>(pos_meas.size());
        Eigen::VectorXd weights(n);
        for (int i = 0; i < n; ++i) {
            weights(i) = weight(pos_meas[i]);
        }

        double sum = weights.sum();
        if (sum <= kMinWeightSum) {
            weights.setConstant(1.0 / n);
        } else {
            weights /= sum;
        }

        Eigen::Vector3d fused = Eigen::Vector3d::Zero();
        for (int i = 0; i < n; ++i) {
            fused += weights(i) * pos_meas[i].z().head<3>();
        }

        std::pair<double, double> conf = calculateConfidence(pos_meas, weights, fused);

        // Same sensor id twice in one gate window accumulates into one entry
        std::map<std::string, double> contrib;
        for (int i = 0; i < n; ++i) {
            contrib[pos_meas[i].sensorId()] += weights(i);
        }

        return FusedEstimate(fused(0), fused(1), fused(2),
                             0.0, 0.0,
                             0.0, 0.0,
                             conf.first, conf.second,
                             std::move(contrib), n);
    }

    /**
     * @brief Dispersion-based confidence.
     * Fewer than two measurements give no dispersion information, so (0.5, 0.5) is returned.
     * Otherwise dispersion is the weighted RMS of the axis-scaled deviations from
     * the fused position; surprise = clip(dispersion / 2) and confidence = 1 - surprise.
     */
    std::pair<double, double> calculateConfidence(const std::vector<SensorMeasurement>& measurements,
                                                  const Eigen::VectorXd& weights,
                                                  const Eigen::Vector3d& fused) const override {
        if (measurements.size() < 2) {
            return {0.5, 0.5};
        }
        const Eigen::Vector3d scale(kLatLonScale, kLatLonScale, kAltitudeScale);

        double weighted_sq = 0.0;
        for (std::size_t i = 0; i < measurements.size(); ++i) {
            Eigen::Vector3d d = (measurements[i].z().head<3>() - fused).cwiseQuotient(scale);
            weighted_sq += weights(static_cast<Eigen::Index>(i)) * d.squaredNorm();
        }
        double dispersion = std::sqrt(std::max(0.0, weighted_sq));

        double surprise = std::clamp(dispersion / 2.0, 0.0, 1.0);
        double fusion_conf = std::clamp(1.0 - surprise, 0.0, 1.0);
        return {fusion_conf, surprise};
    }

    const char* getName() const override { return "weighted"; }

    /**
     * @brief Estimate returned when no usable measurement exists: low confidence, maximal surprise.
     */
    static FusedEstimate fallback() {
        return FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0,
                             0.1, 1.0, {}, 0);
    }

private:
    FusionConfig config_;
};

/**
 * @brief Placeholder for a Kalman-based fusion strategy.
 *
 * Explicitly not implemented: any invocation throws so an unvalidated
 * algorithm can never be used by accident, and no other strategy is
 * silently substituted.
 */
class KalmanFusion : public FusionStrategy {
public:
    FusedEstimate fuse(const std::vector<SensorMeasurement>&) const override {
        throw std::runtime_error("KalmanFusion::fuse is not implemented and must not be used for fusion.");
    }

    std::pair<double, double> calculateConfidence(const std::vector<SensorMeasurement>&,
                                                  const Eigen::VectorXd&,
                                                  const Eigen::Vector3d&) const override {
        throw std::runtime_error("KalmanFusion::calculateConfidence is not implemented.");
    }

    const char* getName() const override { return "kalman"; }
};

} // namespace reconfusion

#endif // RECONFUSION_FUSION_STRATEGIES_HPP_
