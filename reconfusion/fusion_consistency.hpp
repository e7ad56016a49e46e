// fusion_consistency.hpp
#ifndef RECONFUSION_FUSION_CONSISTENCY_HPP_
#define RECONFUSION_FUSION_CONSISTENCY_HPP_

#include <vector>
#include <Eigen/Dense>
#include <Eigen/Cholesky> // For LDLT

// Boost.Math for the chi-squared distribution used by the consistency test
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/log/trivial.hpp>

#include "common_types.hpp"
#include "fusion_strategies.hpp" // For FusionStrategy::positionMeasurements

namespace reconfusion {

/**
 * @brief Result of a consistency check on one fused position.
 */
struct ConsistencyResult {
    double nis = 0.0;         // Summed normalized innovation squared
    int degrees_of_freedom = 0;
    bool consistent = true;
};

/**
 * @brief The FusionConsistencyChecker measures how well the fused inputs agree
 * with the fused position, relative to their own reported covariances.
 *
 * For each fused measurement the 3D residual d = z[0..2] - x_fused is
 * normalized by the measurement's position covariance block; the summed NIS
 * is compared against chi-squared quantiles with 3 * (n - 1) degrees of
 * freedom (three are consumed by estimating the fused position itself).
 *
 * The check is diagnostic only: it never changes the fused estimate.
 */
class FusionConsistencyChecker {
public:
    double chi_squared_alpha_lower_; // Lower percentile for consistency test
    double chi_squared_alpha_upper_; // Upper percentile for consistency test

    /**
     * @param alpha_lower Lower percentile for the chi-squared consistency test (e.g., 0.01).
     * @param alpha_upper Upper percentile for the chi-squared consistency test (e.g., 0.99).
     */
    FusionConsistencyChecker(double alpha_lower = 0.01, double alpha_upper = 0.99)
        : chi_squared_alpha_lower_(alpha_lower),
          chi_squared_alpha_upper_(alpha_upper) {}

    /**
     * @brief Normalized innovation squared of one measurement about the fused position.
     * @return The NIS, or a negative value if the position covariance block is singular.
     */
    static double measurementNis(const SensorMeasurement& m, const Eigen::Vector3d& fused) {
        Eigen::Vector3d d = m.z().head<3>() - fused;
        Eigen::Matrix3d R3 = m.R().topLeftCorner<3, 3>();
        Eigen::LDLT<Eigen::Matrix3d> ldlt(R3);
        if (ldlt.info() != Eigen::Success || !ldlt.isPositive() ||
            (ldlt.vectorD().array() <= 0.0).any()) {
            return -1.0;
        }
        return d.dot(ldlt.solve(d));
    }

    /**
     * @brief Runs the check over the measurements a fusion step received.
     * Non-position and dropped measurements are ignored, as they are by the fusion itself.
     */
    ConsistencyResult check(const std::vector<SensorMeasurement>& measurements,
                            const FusedEstimate& fused) const {
        ConsistencyResult result;
        std::vector<SensorMeasurement> pos_meas = FusionStrategy::positionMeasurements(measurements);
        if (pos_meas.size() < 2) {
            return result; // No redundancy to test
        }

        const Eigen::Vector3d x = fused.position();
        int used = 0;
        for (const auto& m : pos_meas) {
            double nis = measurementNis(m, x);
            if (nis < 0.0) {
                BOOST_LOG_TRIVIAL(debug) << "Skipping " << m.sensorId()
                                         << " in consistency check: singular covariance.";
                continue;
            }
            result.nis += nis;
            ++used;
        }
        if (used < 2) {
            result.nis = 0.0;
            return result;
        }

        result.degrees_of_freedom = 3 * (used - 1);
        result.consistent = checkConsistency(result.nis, result.degrees_of_freedom);
        return result;
    }

    /**
     * @brief Chi-squared bounds test.
     * @return True if nis lies within the configured quantiles of chi2(dof).
     */
    bool checkConsistency(double nis_value, int dof) const {
        if (dof <= 0) {
            return true;
        }
        boost::math::chi_squared_distribution<> chi_sq_dist(dof);
        double lower_bound = boost::math::quantile(chi_sq_dist, chi_squared_alpha_lower_);
        double upper_bound = boost::math::quantile(chi_sq_dist, chi_squared_alpha_upper_);
        return (nis_value >= lower_bound && nis_value <= upper_bound);
    }
};

} // namespace reconfusion

#endif // RECONFUSION_FUSION_CONSISTENCY_HPP_
