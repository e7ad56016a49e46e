// test_helpers.hpp
#ifndef RECONFUSION_TEST_HELPERS_HPP_
#define RECONFUSION_TEST_HELPERS_HPP_

#include <cstdint>
#include <string>

#include <Eigen/Dense>

#include "common_types.hpp"

namespace reconfusion {
namespace testing_helpers {

constexpr double TOL = 1e-9;

// Position-style measurement with an isotropic covariance.
inline SensorMeasurement makePosition(const std::string& id,
                                      SensorType type,
                                      std::int64_t tick,
                                      const Eigen::Vector3d& z,
                                      double variance = 1.0,
                                      double quality = 1.0,
                                      double latency_ms = 0.0,
                                      bool dropped = false,
                                      MetaMap meta = {}) {
    Eigen::MatrixXd R = Eigen::MatrixXd::Identity(3, 3) * variance;
    return SensorMeasurement(tick, "2026-01-01T00:00:00.000000Z", id, type,
                             z, R, quality, latency_ms, dropped, std::move(meta));
}

// Measurement that only matters for its timing.
inline SensorMeasurement makeTimed(const std::string& id,
                                   std::int64_t tick,
                                   double latency_ms,
                                   bool dropped = false) {
    return makePosition(id, SensorType::GNSS, tick, Eigen::Vector3d(50.0, 36.0, 1000.0),
                        1.0, 0.9, latency_ms, dropped);
}

} // namespace testing_helpers
} // namespace reconfusion

#endif // RECONFUSION_TEST_HELPERS_HPP_
