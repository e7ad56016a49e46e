// common_types.hpp
#ifndef RECONFUSION_COMMON_TYPES_HPP_
#define RECONFUSION_COMMON_TYPES_HPP_

#include <Eigen/Dense> // For Eigen::VectorXd, Eigen::MatrixXd
#include <cmath>       // For std::isfinite
#include <cstdint>     // For std::int64_t
#include <map>         // For metadata and contribution maps
#include <stdexcept>   // For std::runtime_error
#include <string>      // For sensor ids, timestamps
#include <variant>     // For MetaValue

namespace reconfusion {

// --- Enums ---

// Enum for sensor types
enum class SensorType {
    IMU,
    GNSS,
    BARO,
    RADAR,
    EOIR,
    RF,
    LINK
};

// Discrete governance classification, ordered from calm to alarming
enum class SystemState {
    STABLE,
    TENSE,
    HIGH_RISK,
    CRITICAL
};

inline const char* toString(SensorType type) {
    switch (type) {
        case SensorType::IMU:   return "IMU";
        case SensorType::GNSS:  return "GNSS";
        case SensorType::BARO:  return "BARO";
        case SensorType::RADAR: return "RADAR";
        case SensorType::EOIR:  return "EOIR";
        case SensorType::RF:    return "RF";
        case SensorType::LINK:  return "LINK";
    }
    return "UNKNOWN";
}

// Sensor types whose first three z components are [lat, lon, alt]
inline bool isPositionType(SensorType type) {
    return type == SensorType::GNSS || type == SensorType::EOIR || type == SensorType::RADAR;
}

inline const char* toString(SystemState state) {
    switch (state) {
        case SystemState::STABLE:    return "STABLE";
        case SystemState::TENSE:     return "TENSE";
        case SystemState::HIGH_RISK: return "HIGH_RISK";
        case SystemState::CRITICAL:  return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Metadata value attached to a measurement: either a number or a short tag.
 */
using MetaValue = std::variant<double, std::string>;
using MetaMap = std::map<std::string, MetaValue>;

namespace detail {

inline void requireRange(double value, double lo, double hi, const char* owner, const char* field) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        throw std::runtime_error(std::string(owner) + ": " + field + " out of range [" +
                                 std::to_string(lo) + ", " + std::to_string(hi) + "], got " +
                                 std::to_string(value) + ".");
    }
}

inline void requireNonNegative(double value, const char* owner, const char* field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::runtime_error(std::string(owner) + ": " + field + " must be a finite value >= 0, got " +
                                 std::to_string(value) + ".");
    }
}

} // namespace detail

/**
 * @brief One sensor's reading for one tick.
 *
 * The interpretation of z depends on the sensor type:
 * e.g., for GNSS/EOIR/RADAR: [lat_deg, lon_deg, altitude_m]
 * e.g., for LINK: [latency_ms, comms_loss, 0]
 * e.g., for IMU: [drift_deg_s, 0, 0]
 * e.g., for BARO: [altitude_m, 0, 0]
 *
 * A dropped measurement keeps its z and R so the audit trail stays complete,
 * but it never takes part in fusion.
 */
class SensorMeasurement {
public:
    /**
     * @brief Constructs a validated measurement.
     * @throws std::runtime_error if z is empty or non-finite, R is not square with z's
     * dimension, or quality/latency/tick are out of range.
     */
    SensorMeasurement(std::int64_t tick,
                      std::string utc_timestamp,
                      std::string sensor_id,
                      SensorType sensor_type,
                      Eigen::VectorXd z,
                      Eigen::MatrixXd R,
                      double quality,
                      double latency_ms,
                      bool dropped = false,
                      MetaMap meta = {})
        : tick_(tick),
          utc_timestamp_(std::move(utc_timestamp)),
          sensor_id_(std::move(sensor_id)),
          sensor_type_(sensor_type),
          z_(std::move(z)),
          R_(std::move(R)),
          quality_(quality),
          latency_ms_(latency_ms),
          dropped_(dropped),
          meta_(std::move(meta)) {
        if (tick_ < 0) {
            throw std::runtime_error("SensorMeasurement: tick must be >= 0.");
        }
        if (sensor_id_.empty()) {
            throw std::runtime_error("SensorMeasurement: sensor_id must not be empty.");
        }
        if (z_.size() == 0) {
            throw std::runtime_error("SensorMeasurement: measurement vector z must not be empty.");
        }
        if (isPositionType(sensor_type_) && z_.size() < 3) {
            throw std::runtime_error(std::string("SensorMeasurement: ") + toString(sensor_type_) +
                                     " measurement must carry [lat, lon, alt].");
        }
        if (!z_.allFinite()) {
            throw std::runtime_error("SensorMeasurement: measurement vector z contains non-finite values.");
        }
        if (R_.rows() != R_.cols()) {
            throw std::runtime_error("SensorMeasurement: covariance matrix R must be square (2D).");
        }
        if (R_.rows() != z_.size()) {
            throw std::runtime_error("SensorMeasurement: covariance matrix R must match the dimension of z.");
        }
        if (!R_.allFinite()) {
            throw std::runtime_error("SensorMeasurement: covariance matrix R contains non-finite values.");
        }
        detail::requireRange(quality_, 0.0, 1.0, "SensorMeasurement", "quality");
        detail::requireNonNegative(latency_ms_, "SensorMeasurement", "latency_ms");
    }

    std::int64_t tick() const { return tick_; }
    const std::string& utcTimestamp() const { return utc_timestamp_; }
    const std::string& sensorId() const { return sensor_id_; }
    SensorType sensorType() const { return sensor_type_; }
    const Eigen::VectorXd& z() const { return z_; }
    const Eigen::MatrixXd& R() const { return R_; }
    double quality() const { return quality_; }
    double latencyMs() const { return latency_ms_; }
    bool dropped() const { return dropped_; }
    const MetaMap& meta() const { return meta_; }

    /**
     * @brief Numeric metadata lookup.
     * @return The stored number, or fallback if the key is absent or holds a string.
     */
    double metaNumber(const std::string& key, double fallback) const {
        auto it = meta_.find(key);
        if (it == meta_.end()) return fallback;
        if (const double* v = std::get_if<double>(&it->second)) return *v;
        return fallback;
    }

private:
    std::int64_t tick_;
    std::string utc_timestamp_;
    std::string sensor_id_;
    SensorType sensor_type_;
    Eigen::VectorXd z_;
    Eigen::MatrixXd R_;
    double quality_;
    double latency_ms_;
    bool dropped_;
    MetaMap meta_;
};

/**
 * @brief Output of a fusion strategy for one tick.
 */
class FusedEstimate {
public:
    static constexpr double kContributionSumTolerance = 1e-6;

    /**
     * @brief Constructs a validated estimate.
     * @throws std::runtime_error if any field leaves its documented range or if the
     * contribution weights are negative or do not sum to one.
     */
    FusedEstimate(double lat,
                  double lon,
                  double altitude_m,
                  double velocity_mps,
                  double heading_deg,
                  double threat_index,
                  double civ_density,
                  double fusion_conf,
                  double surprise,
                  std::map<std::string, double> sensor_contrib,
                  int used_meas_count)
        : lat_(lat),
          lon_(lon),
          altitude_m_(altitude_m),
          velocity_mps_(velocity_mps),
          heading_deg_(heading_deg),
          threat_index_(threat_index),
          civ_density_(civ_density),
          fusion_conf_(fusion_conf),
          surprise_(surprise),
          sensor_contrib_(std::move(sensor_contrib)),
          used_meas_count_(used_meas_count) {
        detail::requireRange(lat_, -90.0, 90.0, "FusedEstimate", "lat");
        detail::requireRange(lon_, -180.0, 180.0, "FusedEstimate", "lon");
        detail::requireRange(altitude_m_, -1000.0, 50000.0, "FusedEstimate", "altitude_m");
        detail::requireRange(velocity_mps_, 0.0, 2000.0, "FusedEstimate", "velocity_mps");
        detail::requireRange(heading_deg_, 0.0, 360.0, "FusedEstimate", "heading_deg");
        detail::requireRange(threat_index_, 0.0, 100.0, "FusedEstimate", "threat_index");
        detail::requireRange(civ_density_, 0.0, 1.0, "FusedEstimate", "civ_density");
        detail::requireRange(fusion_conf_, 0.0, 1.0, "FusedEstimate", "fusion_conf");
        detail::requireRange(surprise_, 0.0, 1.0, "FusedEstimate", "surprise");
        if (used_meas_count_ < 0) {
            throw std::runtime_error("FusedEstimate: used_meas_count must be >= 0.");
        }
        if (!sensor_contrib_.empty()) {
            double sum = 0.0;
            for (const auto& kv : sensor_contrib_) {
                detail::requireNonNegative(kv.second, "FusedEstimate", "sensor_contrib weight");
                sum += kv.second;
            }
            if (std::abs(sum - 1.0) > kContributionSumTolerance) {
                throw std::runtime_error("FusedEstimate: sensor_contrib weights must sum to 1, got " +
                                         std::to_string(sum) + ".");
            }
        }
    }

    double lat() const { return lat_; }
    double lon() const { return lon_; }
    double altitudeM() const { return altitude_m_; }
    double velocityMps() const { return velocity_mps_; }
    double headingDeg() const { return heading_deg_; }
    double threatIndex() const { return threat_index_; }
    double civDensity() const { return civ_density_; }
    double fusionConf() const { return fusion_conf_; }
    double surprise() const { return surprise_; }
    const std::map<std::string, double>& sensorContrib() const { return sensor_contrib_; }
    int usedMeasCount() const { return used_meas_count_; }

    Eigen::Vector3d position() const { return Eigen::Vector3d(lat_, lon_, altitude_m_); }

private:
    double lat_;
    double lon_;
    double altitude_m_;
    double velocity_mps_;
    double heading_deg_;
    double threat_index_;
    double civ_density_;
    double fusion_conf_;
    double surprise_;
    std::map<std::string, double> sensor_contrib_;
    int used_meas_count_;
};

/**
 * @brief Complete per-tick snapshot: physical truth, fused navigation, governance
 * outputs and fusion health. The only per-tick artifact consumers read.
 */
class Telemetry {
public:
    /**
     * @brief Plain field set, filled in by the step engine and validated by Telemetry.
     * The default constructor explicitly initializes all numeric fields to 0.0.
     */
    struct Values {
        // Timing
        std::int64_t tick = 0;
        std::string utc_timestamp;
        double mission_time_s = 0.0;
        std::string mission_stage_code;
        std::string mission_stage_label;
        std::int64_t mission_stage_tick = 0;

        // Physical truth
        double mach = 0.0;
        double velocity_mps = 0.0;
        double altitude_m = 0.0;
        double q_kpa = 0.0;
        double thermal_index = 0.0;
        double g_load = 0.0;
        double link_latency_ms = 0.0;
        double imu_drift_deg_s = 0.0;

        // Navigation (fused)
        double lat = 0.0;
        double lon = 0.0;
        double nav_altitude_m = 0.0;

        // Environment
        double threat_index = 0.0;
        double civ_density = 0.0;
        double comms_loss = 0.0;
        double vision_hot_ratio = 0.0;

        // Governance
        double clarity = 0.0;
        double risk = 0.0;
        double predicted_risk = 0.0;
        SystemState state = SystemState::STABLE;
        double envelope_pressure = 0.0;

        // Console contracts
        double cc_combined = 0.0;
        double cc_nav_conf = 0.0;
        double cc_comms_conf = 0.0;
        double cc_vision_conf = 0.0;
        double cc_clarity_factor = 0.0;
        double cc_threat_factor = 0.0;

        // Fusion health
        double fusion_conf = 0.0;
        double fusion_surprise = 0.0;
        int used_meas_count = 0;
        double fusion_nis = 0.0;
        bool fusion_consistent = true;
    };

    /**
     * @throws std::runtime_error if any field leaves its documented range.
     */
    explicit Telemetry(Values values) : values_(std::move(values)) {
        const Values& v = values_;
        const char* owner = "Telemetry";
        if (v.tick < 0) throw std::runtime_error("Telemetry: tick must be >= 0.");
        if (v.mission_stage_tick < 0) throw std::runtime_error("Telemetry: mission_stage_tick must be >= 0.");
        if (v.used_meas_count < 0) throw std::runtime_error("Telemetry: used_meas_count must be >= 0.");
        detail::requireNonNegative(v.mission_time_s, owner, "mission_time_s");

        detail::requireRange(v.mach, 0.0, 5.0, owner, "mach");
        detail::requireRange(v.velocity_mps, 0.0, 2000.0, owner, "velocity_mps");
        detail::requireRange(v.altitude_m, -1000.0, 50000.0, owner, "altitude_m");
        detail::requireRange(v.q_kpa, 0.0, 1000.0, owner, "q_kpa");
        detail::requireRange(v.thermal_index, 0.0, 1.0, owner, "thermal_index");
        detail::requireRange(v.g_load, 0.0, 10.0, owner, "g_load");
        detail::requireRange(v.link_latency_ms, 0.0, 2000.0, owner, "link_latency_ms");
        detail::requireRange(v.imu_drift_deg_s, 0.0, 2.0, owner, "imu_drift_deg_s");

        detail::requireRange(v.lat, -90.0, 90.0, owner, "lat");
        detail::requireRange(v.lon, -180.0, 180.0, owner, "lon");
        detail::requireRange(v.nav_altitude_m, -1000.0, 50000.0, owner, "nav_altitude_m");

        detail::requireRange(v.threat_index, 0.0, 100.0, owner, "threat_index");
        detail::requireRange(v.civ_density, 0.0, 1.0, owner, "civ_density");
        detail::requireRange(v.comms_loss, 0.0, 1.0, owner, "comms_loss");
        detail::requireRange(v.vision_hot_ratio, 0.0, 1.0, owner, "vision_hot_ratio");

        detail::requireRange(v.clarity, 0.0, 100.0, owner, "clarity");
        detail::requireRange(v.risk, 0.0, 100.0, owner, "risk");
        detail::requireRange(v.predicted_risk, 0.0, 100.0, owner, "predicted_risk");
        detail::requireRange(v.envelope_pressure, 0.0, 2.0, owner, "envelope_pressure");

        detail::requireRange(v.cc_combined, 0.0, 1.0, owner, "cc_combined");
        detail::requireRange(v.cc_nav_conf, 0.0, 1.0, owner, "cc_nav_conf");
        detail::requireRange(v.cc_comms_conf, 0.0, 1.0, owner, "cc_comms_conf");
        detail::requireRange(v.cc_vision_conf, 0.0, 1.0, owner, "cc_vision_conf");
        detail::requireRange(v.cc_clarity_factor, 0.0, 1.0, owner, "cc_clarity_factor");
        detail::requireRange(v.cc_threat_factor, 0.0, 1.0, owner, "cc_threat_factor");

        detail::requireRange(v.fusion_conf, 0.0, 1.0, owner, "fusion_conf");
        detail::requireRange(v.fusion_surprise, 0.0, 1.0, owner, "fusion_surprise");
        detail::requireNonNegative(v.fusion_nis, owner, "fusion_nis");
    }

    const Values& values() const { return values_; }

    std::int64_t tick() const { return values_.tick; }
    double clarity() const { return values_.clarity; }
    double risk() const { return values_.risk; }
    SystemState state() const { return values_.state; }

private:
    Values values_;
};

} // namespace reconfusion

#endif // RECONFUSION_COMMON_TYPES_HPP_
