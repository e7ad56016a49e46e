// step_engine.hpp
#ifndef RECONFUSION_STEP_ENGINE_HPP_
#define RECONFUSION_STEP_ENGINE_HPP_

#include <algorithm> // For std::clamp, std::max
#include <cmath>     // For std::exp
#include <cstdint>   // For std::int64_t
#include <optional>  // For the previous tick's truth
#include <stdexcept> // For std::runtime_error
#include <string>
#include <utility>   // For std::move
#include <vector>

#include <boost/log/trivial.hpp>

// Project-specific Headers
#include "audit_chain.hpp"
#include "clarity_risk.hpp"
#include "common_types.hpp"
#include "engine_state.hpp"
#include "fusion_config.hpp"
#include "fusion_engine.hpp"
#include "scenario_presets.hpp"
#include "sensor_simulator.hpp"

namespace reconfusion {

/**
 * @brief The StepEngine advances an EngineState by exactly one tick:
 * ground truth, sensors, time-gated fusion, audit record, governance and
 * telemetry.
 *
 * Everything is computed on locals first and committed to the state only
 * after every stage succeeded. A tick that throws (e.g., with the Kalman
 * placeholder selected) leaves the state exactly as it was.
 */
class StepEngine {
public:
    // Truth generation constants
    static constexpr double kSpeedOfSoundMps = 295.0;
    static constexpr double kSeaLevelDensity = 1.225; // kg/m^3
    static constexpr double kScaleHeightM = 8000.0;
    static constexpr double kMaxAltitudeM = 18000.0;
    static constexpr double kMaxDynamicPressureKpa = 900.0;

    explicit StepEngine(const FusionConfig& config)
        : config_(config),
          fusion_engine_(config) {
        config_.validate();
    }

    const FusionConfig& config() const { return config_; }

    /**
     * @brief Generates the next tick's ground truth from the previous one.
     * Draw order: mach, altitude, thermal noise, lat, lon, threat, civ density, hot ratio.
     * @param previous Last tick's truth, or none on the first tick.
     */
    static GroundTruth generateTruth(const std::optional<GroundTruth>& previous,
                                     const FlightEnvelope& envelope,
                                     const EnvironmentProfile& env,
                                     const AreaOfOperation& ao,
                                     TickRandom& rng) {
        const double prev_mach = previous ? previous->mach : 0.0;
        const double prev_alt = previous ? previous->altitude_m : 0.0;
        const double prev_threat = previous ? previous->threat_index : 40.0;
        const double prev_civ = previous ? previous->civ_density : 0.3;

        GroundTruth t;
        t.mach = std::clamp(prev_mach + rng.uniform(0.01, 0.05), 0.0, envelope.max_mach);
        t.altitude_m = std::clamp(prev_alt + rng.uniform(50.0, 150.0), 0.0, kMaxAltitudeM);
        t.velocity_mps = t.mach * kSpeedOfSoundMps;

        double rho = kSeaLevelDensity * std::exp(-t.altitude_m / kScaleHeightM);
        t.q_kpa = std::clamp(0.5 * rho * t.velocity_mps * t.velocity_mps / 1000.0, 0.0, kMaxDynamicPressureKpa);

        t.thermal_index = std::clamp(0.2 + 0.5 * (t.mach / envelope.max_mach) + env.thermal_bias +
                                     rng.normal(0.0, 0.02),
                                     0.0, 1.0);
        t.g_load = 1.0;

        t.lat = ao.base_lat + rng.uniform(-ao.lat_delta, ao.lat_delta);
        t.lon = ao.base_lon + rng.uniform(-ao.lon_delta, ao.lon_delta);

        t.threat_index = std::clamp(prev_threat + rng.uniform(-5.0, 5.0), 0.0, 100.0);
        t.civ_density = std::clamp(prev_civ + rng.uniform(-0.05, 0.05), 0.0, 1.0);
        t.vision_hot_ratio = std::clamp(0.10 + rng.normal(0.0, 0.03), 0.0, 1.0);
        return t;
    }

    /**
     * @brief Advances the state by one tick.
     * @param state The run to advance; untouched if this throws.
     * @return The telemetry of the new tick (also appended to state.history).
     * @throws std::runtime_error if the state was built from another config, from the
     * fusion strategy, or from value validation.
     */
    const Telemetry& advance(EngineState& state) {
        if (state.config() != config_) {
            throw std::runtime_error("StepEngine: state was created with a different FusionConfig.");
        }
        const std::int64_t next_tick = state.tick + 1;
        const std::string utc = state.utcForTick(next_tick);

        const EnvironmentProfile& env = presets::environment(state.env_name);
        const FlightEnvelope& envelope = presets::envelope(state.envelope_name);
        const AreaOfOperation& ao = presets::area(state.ao_name);
        fusion_engine_.setStrategy(state.fusion_strategy_name);

        TickRandom rng(state.rng_seed + static_cast<std::uint64_t>(next_tick));

        GroundTruth truth = generateTruth(state.truth, envelope, env, ao, rng);
        std::vector<SensorMeasurement> measurements = simulator_.simulateAll(next_tick, utc, truth, env, rng);

        // Fuse as if the new measurements were already in the history
        FusionResult fusion = fusion_engine_.fuse(state.meas_history, next_tick, measurements);
        AuditRecord audit = buildAuditRecord(next_tick, utc, fusion.used, fusion.estimate);

        PhysicalSignals signals;
        signals.q_kpa = truth.q_kpa;
        signals.thermal_index = truth.thermal_index;
        signals.threat_index = truth.threat_index;
        GovernanceResult gov = calculator_.compute(envelope, signals, fusion.estimate, state.clarity_ema);

        const std::vector<MissionStage>& stages = presets::missionStages();
        const MissionStage& stage = stages.at(state.mission_stage_index);

        Telemetry telemetry = assembleTelemetry(next_tick, utc, state.mission_time_s + config_.dt_seconds,
                                                stage, state.mission_stage_tick,
                                                truth, measurements, fusion, gov);

        // Stage in effect after this tick
        std::size_t next_stage_index = state.mission_stage_index;
        std::int64_t next_stage_tick = state.mission_stage_tick + 1;
        if (next_stage_index + 1 < stages.size() && next_stage_tick >= stage.duration) {
            ++next_stage_index;
            next_stage_tick = 0;
            BOOST_LOG_TRIVIAL(info) << "Tick " << next_tick << ": mission stage " << stage.label
                                    << " -> " << stages[next_stage_index].label;
        }

        // --- Commit ---
        for (const auto& m : measurements) {
            state.last_seen_tick[m.sensorId()] = m.tick();
            state.meas_history.push_back(m);
        }
        state.truth = truth;
        state.fused = fusion.estimate;
        state.clarity_ema = gov.clarity_ema;
        state.audit_chain.push_back(std::move(audit));
        state.history.push_back(std::move(telemetry));
        state.tick = next_tick;
        state.mission_time_s += config_.dt_seconds;
        state.mission_stage_index = next_stage_index;
        state.mission_stage_tick = next_stage_tick;

        const Telemetry& committed = state.history.back();
        BOOST_LOG_TRIVIAL(debug) << "Tick " << committed.tick() << " " << utc
                                 << " clarity=" << committed.clarity()
                                 << " risk=" << committed.risk()
                                 << " state=" << toString(committed.state());
        return committed;
    }

private:
    FusionConfig config_;
    SensorSimulator simulator_;
    FusionEngine fusion_engine_;
    ClarityRiskCalculator calculator_;

    static const SensorMeasurement* findSensor(const std::vector<SensorMeasurement>& measurements,
                                               const char* sensor_id) {
        for (const auto& m : measurements) {
            if (m.sensorId() == sensor_id) {
                return &m;
            }
        }
        return nullptr;
    }

    static Telemetry assembleTelemetry(std::int64_t tick,
                                       const std::string& utc,
                                       double mission_time_s,
                                       const MissionStage& stage,
                                       std::int64_t stage_tick,
                                       const GroundTruth& truth,
                                       const std::vector<SensorMeasurement>& measurements,
                                       const FusionResult& fusion,
                                       const GovernanceResult& gov) {
        const SensorMeasurement* link = findSensor(measurements, SensorSimulator::kLinkId);
        const SensorMeasurement* imu = findSensor(measurements, SensorSimulator::kImuId);
        const SensorMeasurement* eoir = findSensor(measurements, SensorSimulator::kEoirId);
        const FusedEstimate& fused = fusion.estimate;

        Telemetry::Values v;
        v.tick = tick;
        v.utc_timestamp = utc;
        v.mission_time_s = mission_time_s;
        v.mission_stage_code = stage.code;
        v.mission_stage_label = stage.label;
        v.mission_stage_tick = stage_tick;

        v.mach = truth.mach;
        v.velocity_mps = truth.velocity_mps;
        v.altitude_m = truth.altitude_m;
        v.q_kpa = truth.q_kpa;
        v.thermal_index = truth.thermal_index;
        v.g_load = truth.g_load;
        v.link_latency_ms = link ? link->z()(0) : 0.0;
        v.imu_drift_deg_s = imu ? imu->metaNumber("imu_drift_deg_s", 0.0) : 0.0;

        v.lat = fused.lat();
        v.lon = fused.lon();
        v.nav_altitude_m = fused.altitudeM();

        v.threat_index = truth.threat_index;
        v.civ_density = truth.civ_density;
        v.comms_loss = link ? link->metaNumber("comms_loss", 0.0) : 0.0;
        v.vision_hot_ratio = truth.vision_hot_ratio;

        v.clarity = gov.clarity;
        v.risk = gov.risk;
        v.predicted_risk = gov.predicted_risk;
        v.state = gov.state;
        v.envelope_pressure = gov.envelope_pressure;

        v.cc_combined = gov.clarity / 100.0;
        v.cc_nav_conf = fused.fusionConf();
        v.cc_comms_conf = link ? link->quality() : 1.0;
        v.cc_vision_conf = eoir ? eoir->quality() : 0.0;
        v.cc_clarity_factor = gov.clarity / 100.0;
        v.cc_threat_factor = std::max(0.2, 1.0 - truth.threat_index / 150.0);

        v.fusion_conf = fused.fusionConf();
        v.fusion_surprise = fused.surprise();
        v.used_meas_count = fused.usedMeasCount();
        v.fusion_nis = fusion.consistency.nis;
        v.fusion_consistent = fusion.consistency.consistent;

        return Telemetry(std::move(v));
    }
};

} // namespace reconfusion

#endif // RECONFUSION_STEP_ENGINE_HPP_
