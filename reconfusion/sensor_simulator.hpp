// sensor_simulator.hpp
#ifndef RECONFUSION_SENSOR_SIMULATOR_HPP_
#define RECONFUSION_SENSOR_SIMULATOR_HPP_

// Standard Library Headers
#include <algorithm> // For std::clamp (C++17)
#include <cmath>     // For std::abs
#include <cstdint>   // For std::uint64_t
#include <random>    // For std::mt19937_64, std::normal_distribution, std::uniform_real_distribution
#include <string>
#include <vector>

// Eigen Library Headers
#include <Eigen/Dense>

// Project-specific Headers
#include "common_types.hpp"
#include "scenario_presets.hpp"

namespace reconfusion {

/**
 * @brief Per-tick pseudo-random source.
 *
 * Constructed fresh for every tick from a deterministic seed. Draws are
 * stateful, so callers must request them in a fixed order for runs to replay.
 */
class TickRandom {
public:
    explicit TickRandom(std::uint64_t seed)
        : generator_(seed),
          normal_dist_(0.0, 1.0),
          uniform_dist_(0.0, 1.0) {}

    // Gaussian sample; sigma <= 0 still consumes a draw and returns mean.
    double normal(double mean, double sigma) {
        double unit = normal_dist_(generator_);
        return sigma > 0.0 ? mean + sigma * unit : mean;
    }

    Eigen::Vector3d normal(const Eigen::Vector3d& sigma) {
        double a = normal(0.0, sigma(0));
        double b = normal(0.0, sigma(1));
        double c = normal(0.0, sigma(2));
        return Eigen::Vector3d(a, b, c);
    }

    double uniform() { return uniform_dist_(generator_); }

    double uniform(double lo, double hi) { return lo + (hi - lo) * uniform(); }

    bool bernoulli(double p) { return uniform() < p; }

private:
    std::mt19937_64 generator_;
    std::normal_distribution<double> normal_dist_;
    std::uniform_real_distribution<double> uniform_dist_;
};

/**
 * @brief Synthetic ground truth for one tick.
 */
struct GroundTruth {
    double mach = 0.0;
    double velocity_mps = 0.0;
    double altitude_m = 0.0;
    double q_kpa = 0.0;
    double thermal_index = 0.0;
    double g_load = 1.0;
    double lat = 0.0;
    double lon = 0.0;
    double threat_index = 40.0;
    double civ_density = 0.3;
    double vision_hot_ratio = 0.10;

    Eigen::Vector3d position() const { return Eigen::Vector3d(lat, lon, altitude_m); }
};

/**
 * @brief The SensorSimulator produces one synthetic SensorMeasurement per
 * supported sensor for the upcoming tick, given ground truth and an
 * environment degradation profile.
 *
 * The draw order within a tick is fixed:
 * LINK -> IMU -> BARO -> GNSS -> EOIR -> optional RADAR.
 * Any change to this order changes every downstream value of a seeded run.
 */
class SensorSimulator {
public:
    static constexpr double kRadarAvailability = 0.55;

    static constexpr const char* kLinkId = "LINK_1";
    static constexpr const char* kImuId = "IMU_1";
    static constexpr const char* kBaroId = "BARO_1";
    static constexpr const char* kGnssId = "GNSS_A";
    static constexpr const char* kEoirId = "EOIR_1";
    static constexpr const char* kRadarId = "RADAR_1";

    /**
     * @brief Simulates all sensors for one tick.
     * @param tick The upcoming tick number every produced measurement carries.
     * @param utc The UTC timestamp stamped on every produced measurement.
     * @param truth Ground truth for the tick.
     * @param env Active environment profile.
     * @param rng The tick's random source.
     * @return LINK, IMU, BARO, GNSS, EOIR and, when available, RADAR in that order.
     */
    std::vector<SensorMeasurement> simulateAll(std::int64_t tick,
                                               const std::string& utc,
                                               const GroundTruth& truth,
                                               const EnvironmentProfile& env,
                                               TickRandom& rng) const {
        std::vector<SensorMeasurement> measurements;
        measurements.reserve(6);

        measurements.push_back(simulateLink(tick, utc, env, rng));
        double comms_loss = measurements.back().metaNumber("comms_loss", 0.0);

        measurements.push_back(simulateImu(tick, utc, env, rng));
        measurements.push_back(simulateBaro(tick, utc, truth, rng));
        measurements.push_back(simulateGnss(tick, utc, truth, env, rng));
        measurements.push_back(simulateEoir(tick, utc, truth, env, rng, comms_loss));

        // RADAR coverage is intermittent
        if (rng.bernoulli(kRadarAvailability)) {
            measurements.push_back(simulateRadar(tick, utc, truth, rng));
        }
        return measurements;
    }

    /**
     * @brief LINK: latency with jitter, and a comms-loss event whose probability grows with latency.
     */
    SensorMeasurement simulateLink(std::int64_t tick, const std::string& utc,
                                   const EnvironmentProfile& env, TickRandom& rng) const {
        double latency = std::clamp(rng.normal(env.latency_base, env.latency_jitter), 40.0, 800.0);
        double comms_loss = rng.bernoulli(0.02 + 0.08 * (latency / 600.0)) ? 1.0 : 0.0;

        return SensorMeasurement(tick, utc, kLinkId, SensorType::LINK,
                                 Eigen::Vector3d(latency, comms_loss, 0.0),
                                 diag(25.0, 0.05, 1.0),
                                 std::clamp(1.0 - latency / 900.0, 0.1, 1.0),
                                 latency, false,
                                 {{"comms_loss", comms_loss}});
    }

    /**
     * @brief IMU: drift proxy (deg/s) made of a constant, the environment bias and half-normal noise.
     */
    SensorMeasurement simulateImu(std::int64_t tick, const std::string& utc,
                                  const EnvironmentProfile& env, TickRandom& rng) const {
        double drift = std::clamp(0.02 + env.imu_drift_bias + std::abs(rng.normal(0.0, 0.01)), 0.005, 0.12);
        double latency = std::clamp(rng.normal(20.0, 8.0), 5.0, 60.0);

        return SensorMeasurement(tick, utc, kImuId, SensorType::IMU,
                                 Eigen::Vector3d(drift, 0.0, 0.0),
                                 diag(0.0004, 1.0, 1.0),
                                 std::clamp(1.0 - drift / 0.15, 0.2, 1.0),
                                 latency, false,
                                 {{"imu_drift_deg_s", drift}});
    }

    SensorMeasurement simulateBaro(std::int64_t tick, const std::string& utc,
                                   const GroundTruth& truth, TickRandom& rng) const {
        double altitude = truth.altitude_m + rng.normal(0.0, 7.0);
        double latency = std::clamp(rng.normal(30.0, 10.0), 5.0, 80.0);

        return SensorMeasurement(tick, utc, kBaroId, SensorType::BARO,
                                 Eigen::Vector3d(altitude, 0.0, 0.0),
                                 diag(49.0, 1.0, 1.0),
                                 0.85, latency, false,
                                 {{"altitude_m_baro", altitude}});
    }

    /**
     * @brief GNSS: position with jam-scaled noise, a jam-driven drop model and
     * an occasional spoof bias.
     *
     * A dropped fix keeps the truth position and the inflated covariance for the
     * audit trail but carries zero quality.
     */
    SensorMeasurement simulateGnss(std::int64_t tick, const std::string& utc,
                                   const GroundTruth& truth, const EnvironmentProfile& env,
                                   TickRandom& rng) const {
        const double jam = env.gnss_jam_factor;
        bool dropped = rng.bernoulli(0.02 + jam * 0.25);

        Eigen::Vector3d std_dev = Eigen::Vector3d(0.00025, 0.00025, 3.5) +
                                  Eigen::Vector3d(0.0012, 0.0012, 15.0) * jam;
        Eigen::MatrixXd R = diagSquared(std_dev);

        if (dropped) {
            double latency = std::clamp(rng.normal(120.0, 35.0), 60.0, 300.0);
            return SensorMeasurement(tick, utc, kGnssId, SensorType::GNSS,
                                     truth.position(), R, 0.0, latency, true,
                                     {{"dropped_reason", std::string("synthetic_jam_drop")},
                                      {"jam_factor", jam}});
        }

        Eigen::Vector3d noise = rng.normal(std_dev);
        Eigen::Vector3d spoof_bias = Eigen::Vector3d::Zero();
        bool spoofed = rng.bernoulli(jam * 0.15);
        if (spoofed) {
            spoof_bias = rng.normal(Eigen::Vector3d(0.002, 0.002, 10.0));
        }
        double latency = std::clamp(rng.normal(90.0, 25.0), 40.0, 220.0);

        MetaMap meta = {{"jam_factor", jam}};
        if (spoofed) {
            meta["spoofed"] = 1.0;
        }
        return SensorMeasurement(tick, utc, kGnssId, SensorType::GNSS,
                                 truth.position() + noise + spoof_bias, R,
                                 std::clamp(0.95 - jam * 0.6, 0.15, 0.95),
                                 latency, false, std::move(meta));
    }

    /**
     * @brief EO/IR: position proxy whose reliability degrades with the environment
     * and with an upstream comms loss (a lossy link makes EO/IR less reliable).
     */
    SensorMeasurement simulateEoir(std::int64_t tick, const std::string& utc,
                                   const GroundTruth& truth, const EnvironmentProfile& env,
                                   TickRandom& rng, double comms_loss) const {
        const double degrade = env.eoir_degrade;
        bool dropped = rng.bernoulli(0.03 + degrade * 0.22 + comms_loss * 0.15);

        Eigen::Vector3d std_dev = Eigen::Vector3d(0.0006, 0.0006, 8.0) +
                                  Eigen::Vector3d(0.0013, 0.0013, 20.0) * degrade;
        Eigen::MatrixXd R = diagSquared(std_dev);

        if (dropped) {
            double latency = std::clamp(rng.normal(180.0, 55.0), 80.0, 400.0);
            return SensorMeasurement(tick, utc, kEoirId, SensorType::EOIR,
                                     truth.position(), R, 0.0, latency, true,
                                     {{"dropped_reason", std::string("synthetic_eoir_drop")}});
        }

        Eigen::Vector3d noise = rng.normal(std_dev);
        double hot_ratio = std::clamp(truth.vision_hot_ratio + rng.normal(0.0, 0.03), 0.0, 1.0);
        double quality = std::clamp(0.82 - degrade * 0.55 - comms_loss * 0.2, 0.1, 0.85);
        double latency = std::clamp(rng.normal(140.0, 45.0), 60.0, 320.0);

        return SensorMeasurement(tick, utc, kEoirId, SensorType::EOIR,
                                 truth.position() + noise, R, quality, latency, false,
                                 {{"hot_ratio", hot_ratio}});
    }

    SensorMeasurement simulateRadar(std::int64_t tick, const std::string& utc,
                                    const GroundTruth& truth, TickRandom& rng) const {
        const Eigen::Vector3d std_dev(0.00045, 0.00045, 6.5);
        Eigen::Vector3d noise = rng.normal(std_dev);
        double latency = std::clamp(rng.normal(110.0, 35.0), 50.0, 280.0);

        return SensorMeasurement(tick, utc, kRadarId, SensorType::RADAR,
                                 truth.position() + noise, diagSquared(std_dev),
                                 0.75, latency, false, {});
    }

private:
    static Eigen::MatrixXd diag(double a, double b, double c) {
        return Eigen::Vector3d(a, b, c).asDiagonal();
    }

    static Eigen::MatrixXd diagSquared(const Eigen::Vector3d& std_dev) {
        return std_dev.array().square().matrix().asDiagonal();
    }
};

} // namespace reconfusion

#endif // RECONFUSION_SENSOR_SIMULATOR_HPP_
