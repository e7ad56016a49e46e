// scenario_presets.hpp
#ifndef RECONFUSION_SCENARIO_PRESETS_HPP_
#define RECONFUSION_SCENARIO_PRESETS_HPP_

#include <map>       // For named preset tables
#include <string>
#include <vector>

#include <boost/log/trivial.hpp> // For BOOST_LOG_TRIVIAL

namespace reconfusion {

/**
 * @brief Area of operation: a base point and the half-widths of the box the
 * synthetic truth position is drawn from.
 */
struct AreaOfOperation {
    std::string label;
    double base_lat = 0.0;
    double base_lon = 0.0;
    double lat_delta = 0.0;
    double lon_delta = 0.0;
};

/**
 * @brief Environment degradation profile consumed by the sensor simulator and
 * the truth generator.
 */
struct EnvironmentProfile {
    std::string name;
    double latency_base = 0.0;    // LINK latency mean (ms)
    double latency_jitter = 0.0;  // LINK latency std dev (ms)
    double thermal_bias = 0.0;    // Added to the thermal index [0,1]
    double imu_drift_bias = 0.0;  // Added to IMU drift (deg/s)
    double gnss_jam_factor = 0.0; // 0.0 clean to 1.0 fully jammed
    double eoir_degrade = 0.0;    // 0.0 clear to 1.0 fully degraded
};

struct FlightEnvelope {
    std::string name;
    double max_mach = 0.0;
    double max_q_kpa = 0.0;
    double max_g = 0.0;
    double max_thermal_index = 0.0;
    double max_latency_ms = 0.0;
    std::string description;
};

struct ThresholdPreset {
    std::string name;
    double clarity_threshold = 0.0; // Alert when clarity falls below
    double threat_threshold = 0.0;  // Alert when threat rises above
    std::string description;
};

struct MissionStage {
    std::string code;
    std::string label;
    int duration = 0; // Ticks spent in the stage
    std::string description;
};

namespace presets {

inline const char* const kDefaultArea = "Kharkiv (synthetic)";
inline const char* const kDefaultEnvironment = "Clear Skies / Clean Link";
inline const char* const kDefaultEnvelope = "Nominal Demo Flight";
inline const char* const kDefaultThresholds = "Balanced";

inline const std::map<std::string, AreaOfOperation>& areas() {
    static const std::map<std::string, AreaOfOperation> table = {
        {"Kharkiv (synthetic)", {"Kharkiv Region", 49.9935, 36.2304, 0.08, 0.12}},
        {"Black Sea (synthetic)", {"Black Sea", 44.5, 34.0, 0.2, 0.3}},
        {"Test Range (synthetic)", {"Test Range", 35.0, -117.0, 0.1, 0.1}},
    };
    return table;
}

inline const std::map<std::string, EnvironmentProfile>& environments() {
    static const std::map<std::string, EnvironmentProfile> table = {
        {"Clear Skies / Clean Link", {"Clear", 120.0, 40.0, 0.0, 0.0, 0.0, 0.0}},
        {"High Latency Link", {"High Lat", 260.0, 80.0, 0.05, 0.02, 0.05, 0.10}},
        {"GNSS Degraded / Spoof Risk", {"GNSS Degraded", 180.0, 70.0, 0.03, 0.03, 0.55, 0.15}},
        {"EO/IR Degraded", {"EOIR Degraded", 140.0, 60.0, 0.02, 0.02, 0.05, 0.55}},
    };
    return table;
}

inline const std::map<std::string, FlightEnvelope>& envelopes() {
    static const std::map<std::string, FlightEnvelope> table = {
        {"Nominal Demo Flight",
         {"Nominal Demo Flight", 1.8, 650.0, 4.5, 0.78, 300.0, "Balanced flight envelope"}},
        {"Conservative Test Profile",
         {"Conservative Test Profile", 1.2, 450.0, 3.5, 0.65, 250.0, "Tight, conservative envelope"}},
        {"Aggressive Envelope Probe",
         {"Aggressive Envelope Probe", 2.3, 800.0, 5.5, 0.90, 350.0, "Aggressive test envelope"}},
    };
    return table;
}

inline const std::map<std::string, ThresholdPreset>& thresholds() {
    static const std::map<std::string, ThresholdPreset> table = {
        {"Balanced", {"Balanced", 75.0, 65.0, "Standard operational thresholds"}},
        {"Conservative", {"Conservative", 85.0, 55.0, "Higher safety margins"}},
        {"Aggressive", {"Aggressive", 65.0, 75.0, "Accept higher risk for mission"}},
    };
    return table;
}

// Ordered: the step engine walks this list by index. The last stage never ends.
inline const std::vector<MissionStage>& missionStages() {
    static const std::vector<MissionStage> table = {
        {"STAGE_1_BOOST", "Boost", 40, "Initial acceleration phase"},
        {"STAGE_2_GRID", "Grid", 70, "Grid search pattern"},
        {"STAGE_3_RELAY", "Relay", 70, "Data relay and communication"},
        {"STAGE_4_COLLAPSE", "Collapse", 50, "Orbit collapse and descent"},
        {"STAGE_5_RTB", "RTB", 9999, "Return to base"},
    };
    return table;
}

/**
 * @brief Looks up a named preset, degrading to the default entry on unknown names.
 * @param table The preset table.
 * @param name The requested name.
 * @param fallback Name of the entry used when name is unknown (must exist in table).
 * @param kind Human-readable table name for the warning.
 */
template<typename T>
const T& lookup(const std::map<std::string, T>& table,
                const std::string& name,
                const char* fallback,
                const char* kind) {
    auto it = table.find(name);
    if (it != table.end()) {
        return it->second;
    }
    BOOST_LOG_TRIVIAL(warning) << "Unknown " << kind << " preset '" << name
                               << "', falling back to '" << fallback << "'.";
    return table.at(fallback);
}

inline const AreaOfOperation& area(const std::string& name) {
    return lookup(areas(), name, kDefaultArea, "area-of-operation");
}

inline const EnvironmentProfile& environment(const std::string& name) {
    return lookup(environments(), name, kDefaultEnvironment, "environment");
}

inline const FlightEnvelope& envelope(const std::string& name) {
    return lookup(envelopes(), name, kDefaultEnvelope, "envelope");
}

inline const ThresholdPreset& threshold(const std::string& name) {
    return lookup(thresholds(), name, kDefaultThresholds, "threshold");
}

} // namespace presets

} // namespace reconfusion

#endif // RECONFUSION_SCENARIO_PRESETS_HPP_
