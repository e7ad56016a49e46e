// fusion_config.hpp
#ifndef RECONFUSION_FUSION_CONFIG_HPP_
#define RECONFUSION_FUSION_CONFIG_HPP_

#include <cstddef>   // For std::size_t
#include <exception> // For std::exception
#include <fstream>   // For std::ofstream
#include <map>
#include <stdexcept> // For std::runtime_error
#include <string>

#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace reconfusion {

/**
 * @brief Knobs for fusion, governance and buffering.
 *
 * Deterministic and serializable: the same config always yields the same run
 * for a given seed. Loaded from YAML; any load problem degrades to the
 * built-in defaults.
 */
struct FusionConfig {
    // Time / cadence
    double dt_seconds = 1.0;
    double fusion_time_gate_ms = 350.0;
    int stale_ticks = 6;

    // History limits (ring buffer capacities)
    std::size_t max_telemetry_history = 600;
    std::size_t max_measurement_history = 3000;
    std::size_t max_audit_history = 1000;

    // Fusion weighting (sensor-type priors, keyed by sensor type name)
    std::map<std::string, double> position_fusion_weight = {
        {"GNSS", 1.0},
        {"EOIR", 0.8},
        {"RADAR", 0.9},
        {"BARO", 0.3},
    };

    // Governance thresholds
    double clarity_warning_threshold = 75.0;
    double clarity_critical_threshold = 65.0;
    double fusion_conf_warning = 0.6;
    double fusion_conf_critical = 0.4;

    // Percentiles for the chi-squared consistency test on fused inputs
    double consistency_alpha_lower = 0.01;
    double consistency_alpha_upper = 0.99;

    /**
     * @brief Checks internal consistency of the knobs.
     * @throws std::runtime_error describing the first offending field.
     */
    void validate() const {
        if (!(dt_seconds > 0.0)) {
            throw std::runtime_error("FusionConfig: dt_seconds must be > 0.");
        }
        if (!(fusion_time_gate_ms >= 0.0)) {
            throw std::runtime_error("FusionConfig: fusion_time_gate_ms must be >= 0.");
        }
        if (stale_ticks < 1) {
            throw std::runtime_error("FusionConfig: stale_ticks must be >= 1.");
        }
        if (max_telemetry_history == 0 || max_measurement_history == 0 || max_audit_history == 0) {
            throw std::runtime_error("FusionConfig: history capacities must be > 0.");
        }
        for (const auto& kv : position_fusion_weight) {
            if (!(kv.second >= 0.0)) {
                throw std::runtime_error("FusionConfig: position_fusion_weight[" + kv.first + "] must be >= 0.");
            }
        }
        if (clarity_critical_threshold > clarity_warning_threshold) {
            throw std::runtime_error("FusionConfig: clarity_critical_threshold must not exceed clarity_warning_threshold.");
        }
        if (fusion_conf_critical > fusion_conf_warning) {
            throw std::runtime_error("FusionConfig: fusion_conf_critical must not exceed fusion_conf_warning.");
        }
        if (!(consistency_alpha_lower > 0.0 && consistency_alpha_lower < consistency_alpha_upper &&
              consistency_alpha_upper < 1.0)) {
            throw std::runtime_error("FusionConfig: consistency alphas must satisfy 0 < lower < upper < 1.");
        }
    }

    bool operator==(const FusionConfig& other) const {
        return dt_seconds == other.dt_seconds &&
               fusion_time_gate_ms == other.fusion_time_gate_ms &&
               stale_ticks == other.stale_ticks &&
               max_telemetry_history == other.max_telemetry_history &&
               max_measurement_history == other.max_measurement_history &&
               max_audit_history == other.max_audit_history &&
               position_fusion_weight == other.position_fusion_weight &&
               clarity_warning_threshold == other.clarity_warning_threshold &&
               clarity_critical_threshold == other.clarity_critical_threshold &&
               fusion_conf_warning == other.fusion_conf_warning &&
               fusion_conf_critical == other.fusion_conf_critical &&
               consistency_alpha_lower == other.consistency_alpha_lower &&
               consistency_alpha_upper == other.consistency_alpha_upper;
    }

    bool operator!=(const FusionConfig& other) const { return !(*this == other); }

    /**
     * @brief Type prior for a sensor type name; unknown types weigh 0.5.
     */
    double positionWeight(const std::string& sensor_type) const {
        auto it = position_fusion_weight.find(sensor_type);
        return it != position_fusion_weight.end() ? it->second : 0.5;
    }

    /**
     * @brief Builds a config from a YAML mapping. Keys not present keep their defaults.
     * @throws YAML::Exception on type mismatches, std::runtime_error on invalid values.
     */
    static FusionConfig fromNode(const YAML::Node& node) {
        FusionConfig cfg;
        if (!node || node.IsNull()) {
            return cfg;
        }
        if (!node.IsMap()) {
            throw std::runtime_error("FusionConfig: top-level YAML node must be a mapping.");
        }
        if (node["dt_seconds"]) cfg.dt_seconds = node["dt_seconds"].as<double>();
        if (node["fusion_time_gate_ms"]) cfg.fusion_time_gate_ms = node["fusion_time_gate_ms"].as<double>();
        if (node["stale_ticks"]) cfg.stale_ticks = node["stale_ticks"].as<int>();
        if (node["max_telemetry_history"]) cfg.max_telemetry_history = node["max_telemetry_history"].as<std::size_t>();
        if (node["max_measurement_history"]) cfg.max_measurement_history = node["max_measurement_history"].as<std::size_t>();
        if (node["max_audit_history"]) cfg.max_audit_history = node["max_audit_history"].as<std::size_t>();
        if (node["position_fusion_weight"]) {
            cfg.position_fusion_weight = node["position_fusion_weight"].as<std::map<std::string, double>>();
        }
        if (node["clarity_warning_threshold"]) cfg.clarity_warning_threshold = node["clarity_warning_threshold"].as<double>();
        if (node["clarity_critical_threshold"]) cfg.clarity_critical_threshold = node["clarity_critical_threshold"].as<double>();
        if (node["fusion_conf_warning"]) cfg.fusion_conf_warning = node["fusion_conf_warning"].as<double>();
        if (node["fusion_conf_critical"]) cfg.fusion_conf_critical = node["fusion_conf_critical"].as<double>();
        if (node["consistency_alpha_lower"]) cfg.consistency_alpha_lower = node["consistency_alpha_lower"].as<double>();
        if (node["consistency_alpha_upper"]) cfg.consistency_alpha_upper = node["consistency_alpha_upper"].as<double>();
        cfg.validate();
        return cfg;
    }

    /**
     * @brief Loads a config file, never failing the caller.
     * A missing file, malformed YAML, wrong value types or invalid values all
     * degrade to the built-in defaults with a logged warning.
     */
    static FusionConfig fromYaml(const std::string& path) {
        try {
            return fromNode(YAML::LoadFile(path));
        } catch (const YAML::BadFile&) {
            BOOST_LOG_TRIVIAL(warning) << "Config file '" << path << "' not readable; using default FusionConfig.";
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Failed to load config from '" << path << "': " << e.what()
                                     << "; using default FusionConfig.";
        }
        return FusionConfig();
    }

    YAML::Node toNode() const {
        YAML::Node node;
        node["dt_seconds"] = dt_seconds;
        node["fusion_time_gate_ms"] = fusion_time_gate_ms;
        node["stale_ticks"] = stale_ticks;
        node["max_telemetry_history"] = max_telemetry_history;
        node["max_measurement_history"] = max_measurement_history;
        node["max_audit_history"] = max_audit_history;
        node["position_fusion_weight"] = position_fusion_weight;
        node["clarity_warning_threshold"] = clarity_warning_threshold;
        node["clarity_critical_threshold"] = clarity_critical_threshold;
        node["fusion_conf_warning"] = fusion_conf_warning;
        node["fusion_conf_critical"] = fusion_conf_critical;
        node["consistency_alpha_lower"] = consistency_alpha_lower;
        node["consistency_alpha_upper"] = consistency_alpha_upper;
        return node;
    }

    std::string toYaml() const {
        YAML::Emitter out;
        out << toNode();
        return out.c_str();
    }

    /**
     * @throws std::runtime_error if the file cannot be written.
     */
    void saveYaml(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("FusionConfig: cannot open '" + path + "' for writing.");
        }
        file << toYaml() << "\n";
        if (!file) {
            throw std::runtime_error("FusionConfig: failed writing '" + path + "'.");
        }
    }
};

} // namespace reconfusion

#endif // RECONFUSION_FUSION_CONFIG_HPP_
