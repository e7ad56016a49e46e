// clarity_risk.hpp
#ifndef RECONFUSION_CLARITY_RISK_HPP_
#define RECONFUSION_CLARITY_RISK_HPP_

#include <algorithm> // For std::clamp
#include <sstream>   // For alert messages
#include <string>
#include <vector>

// Project-specific Headers
#include "common_types.hpp"
#include "fusion_config.hpp"
#include "scenario_presets.hpp"

namespace reconfusion {

/**
 * @brief Physical and environment signals the governance calculation consumes.
 */
struct PhysicalSignals {
    double q_kpa = 0.0;
    double thermal_index = 0.0;
    double threat_index = 0.0;
};

struct GovernanceResult {
    double clarity = 0.0;           // [0,100]
    double risk = 0.0;              // [0,100]
    double predicted_risk = 0.0;    // [0,100]
    SystemState state = SystemState::STABLE;
    double envelope_pressure = 0.0; // [0, 1.68]
    double clarity_ema = 0.0;       // Updated memory, to be committed by the caller
};

/**
 * @brief The ClarityRiskCalculator turns envelope stress, threat and fusion
 * epistemics into the clarity / risk governance signals.
 *
 * Clarity is exponentially smoothed. The calculator itself holds no memory:
 * the prior EMA is passed in and the new one is returned, so a failing tick
 * never leaves a half-updated EMA behind.
 */
class ClarityRiskCalculator {
public:
    static constexpr double kInitialClarityEma = 0.9;
    static constexpr double kEmaAlpha = 0.15;

    /**
     * @brief Computes the governance signals for one tick.
     * @param envelope Active flight envelope (normalization limits).
     * @param signals q, thermal index and threat index of the tick.
     * @param fused The tick's fused estimate (confidence and surprise are used).
     * @param prior_ema clarity_ema carried over from the previous tick, in [0,1].
     * @return Clarity, risk, predicted risk, state, envelope pressure and the new EMA.
     */
    GovernanceResult compute(const FlightEnvelope& envelope,
                             const PhysicalSignals& signals,
                             const FusedEstimate& fused,
                             double prior_ema) const {
        double q_norm = std::clamp(signals.q_kpa / envelope.max_q_kpa, 0.0, 1.6);
        double t_norm = std::clamp(signals.thermal_index / envelope.max_thermal_index, 0.0, 1.8);
        double threat_norm = std::clamp(signals.threat_index / 100.0, 0.0, 1.0);

        double pressure = 0.6 * q_norm + 0.4 * t_norm;

        const double conf = fused.fusionConf();
        const double surprise = fused.surprise();

        // Base clarity from pressure and threat, then epistemic penalties
        double raw = std::clamp(1.0 - pressure - 0.3 * threat_norm, 0.55, 1.0);
        raw *= std::clamp(0.70 + 0.30 * conf, 0.0, 1.0);
        raw *= std::clamp(1.0 - 0.30 * surprise, 0.0, 1.0);

        GovernanceResult result;
        result.clarity_ema = kEmaAlpha * raw + (1.0 - kEmaAlpha) * prior_ema;
        result.clarity = std::clamp(result.clarity_ema * 100.0, 0.0, 100.0);

        result.risk = std::clamp(pressure * 60.0
                                 + (100.0 - result.clarity) * 0.45
                                 + (1.0 - conf) * 18.0
                                 + surprise * 14.0,
                                 0.0, 100.0);
        result.predicted_risk = std::clamp(result.risk + 8.0 * (pressure - 0.8), 0.0, 100.0);
        result.state = classify(result.clarity, result.risk);
        result.envelope_pressure = pressure;
        return result;
    }

    static SystemState classify(double clarity, double risk) {
        if (clarity >= 90.0 && risk < 30.0) {
            return SystemState::STABLE;
        } else if (clarity >= 80.0) {
            return SystemState::TENSE;
        } else if (clarity >= 65.0) {
            return SystemState::HIGH_RISK;
        }
        return SystemState::CRITICAL;
    }
};

// --- Alerts ---

enum class AlertSeverity {
    WARNING,
    CRITICAL
};

inline const char* toString(AlertSeverity severity) {
    return severity == AlertSeverity::CRITICAL ? "CRITICAL" : "WARNING";
}

struct Alert {
    AlertSeverity severity;
    std::string code;
    std::string message;
};

/**
 * @brief Operator alerts for one telemetry snapshot.
 *
 * Codes: CLARITY_LOW, FUSION_CONF_LOW, CLARITY_BELOW_PRESET,
 * THREAT_ABOVE_PRESET, SENSOR_STALE. Each code is raised at most once per
 * call, at its highest applicable severity.
 *
 * @param telemetry The snapshot to evaluate.
 * @param config Supplies the clarity and fusion-confidence thresholds.
 * @param preset The operator-selected threshold preset.
 * @param stale_sensors Ids of sensors not seen for stale_ticks or more.
 */
inline std::vector<Alert> evaluateAlerts(const Telemetry& telemetry,
                                         const FusionConfig& config,
                                         const ThresholdPreset& preset,
                                         const std::vector<std::string>& stale_sensors = {}) {
    std::vector<Alert> alerts;
    const Telemetry::Values& v = telemetry.values();

    auto fmt = [](const char* what, double value, const char* cmp, double limit) {
        std::ostringstream ss;
        ss << what << " " << value << " " << cmp << " " << limit;
        return ss.str();
    };

    if (v.clarity < config.clarity_critical_threshold) {
        alerts.push_back({AlertSeverity::CRITICAL, "CLARITY_LOW",
                          fmt("clarity", v.clarity, "<", config.clarity_critical_threshold)});
    } else if (v.clarity < config.clarity_warning_threshold) {
        alerts.push_back({AlertSeverity::WARNING, "CLARITY_LOW",
                          fmt("clarity", v.clarity, "<", config.clarity_warning_threshold)});
    }

    if (v.fusion_conf < config.fusion_conf_critical) {
        alerts.push_back({AlertSeverity::CRITICAL, "FUSION_CONF_LOW",
                          fmt("fusion_conf", v.fusion_conf, "<", config.fusion_conf_critical)});
    } else if (v.fusion_conf < config.fusion_conf_warning) {
        alerts.push_back({AlertSeverity::WARNING, "FUSION_CONF_LOW",
                          fmt("fusion_conf", v.fusion_conf, "<", config.fusion_conf_warning)});
    }

    if (v.clarity < preset.clarity_threshold) {
        alerts.push_back({AlertSeverity::WARNING, "CLARITY_BELOW_PRESET",
                          fmt("clarity", v.clarity, "<", preset.clarity_threshold) + " (" + preset.name + ")"});
    }
    if (v.threat_index > preset.threat_threshold) {
        alerts.push_back({AlertSeverity::WARNING, "THREAT_ABOVE_PRESET",
                          fmt("threat_index", v.threat_index, ">", preset.threat_threshold) + " (" + preset.name + ")"});
    }

    if (!stale_sensors.empty()) {
        std::string ids;
        for (const auto& id : stale_sensors) {
            if (!ids.empty()) ids += ", ";
            ids += id;
        }
        alerts.push_back({AlertSeverity::WARNING, "SENSOR_STALE", "stale sensors: " + ids});
    }
    return alerts;
}

} // namespace reconfusion

#endif // RECONFUSION_CLARITY_RISK_HPP_
