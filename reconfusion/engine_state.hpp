// engine_state.hpp
#ifndef RECONFUSION_ENGINE_STATE_HPP_
#define RECONFUSION_ENGINE_STATE_HPP_

#include <chrono>   // For the wall-clock seed and run id
#include <cmath>    // For std::llround
#include <cstdint>  // For std::int64_t, std::uint64_t
#include <cstdio>   // For std::snprintf
#include <map>
#include <optional> // For the optional fused estimate, truth and reseed
#include <string>
#include <vector>

#include <boost/circular_buffer.hpp>                // Bounded histories
#include <boost/date_time/posix_time/posix_time.hpp> // Run epoch and tick timestamps

// Project-specific Headers
#include "audit_chain.hpp"
#include "common_types.hpp"
#include "fusion_config.hpp"
#include "scenario_presets.hpp"
#include "sensor_simulator.hpp" // For GroundTruth

namespace reconfusion {

/**
 * @brief Central runtime state of one simulation run.
 *
 * Holds the clock, the seed and epoch that make a run replayable, the
 * scenario selection, governance memory and the three bounded histories.
 * Owned by a single caller and mutated only by StepEngine::advance.
 */
class EngineState {
public:
    static constexpr double kInitialClarityEma = 0.9;
    static constexpr const char* kDefaultStrategy = "weighted";

    // --- Simulation clock ---
    std::int64_t tick = 0;
    double mission_time_s = 0.0;
    std::size_t mission_stage_index = 0;
    std::int64_t mission_stage_tick = 0;

    // --- Identity / determinism ---
    std::int64_t run_id = 0;
    std::uint64_t rng_seed = 0;
    boost::posix_time::ptime epoch; // UTC time of tick 0

    // --- Scenario selection ---
    std::string env_name = presets::kDefaultEnvironment;
    std::string envelope_name = presets::kDefaultEnvelope;
    std::string ao_name = presets::kDefaultArea;
    std::string threshold_name = presets::kDefaultThresholds;
    std::string fusion_strategy_name = kDefaultStrategy;

    // --- Governance memory ---
    double clarity_ema = kInitialClarityEma;

    // --- Histories (oldest evicted first) ---
    boost::circular_buffer<Telemetry> history;
    boost::circular_buffer<SensorMeasurement> meas_history;
    boost::circular_buffer<AuditRecord> audit_chain;

    // --- Last outputs ---
    std::optional<GroundTruth> truth;
    std::optional<FusedEstimate> fused;
    std::map<std::string, std::int64_t> last_seen_tick;

    /**
     * @brief Creates a fresh run.
     * @param config Supplies the history capacities and the tick duration.
     * @param seed Run seed; derived from the wall clock when not given.
     * @param run_epoch UTC time of tick 0; the current second when not given.
     */
    explicit EngineState(const FusionConfig& config,
                         std::optional<std::uint64_t> seed = std::nullopt,
                         std::optional<boost::posix_time::ptime> run_epoch = std::nullopt)
        : rng_seed(seed ? *seed : wallClockSeed()),
          epoch(run_epoch ? *run_epoch : boost::posix_time::second_clock::universal_time()),
          history(config.max_telemetry_history),
          meas_history(config.max_measurement_history),
          audit_chain(config.max_audit_history),
          config_(config) {
        config_.validate();
        run_id = wallClockMillis();
    }

    const FusionConfig& config() const { return config_; }

    /**
     * @brief Resets the run: clock, histories, last outputs, last-seen map and
     * governance memory. Configuration, scenario selection and epoch are kept.
     * @param new_seed Replaces the run seed when given.
     */
    void reset(std::optional<std::uint64_t> new_seed = std::nullopt) {
        tick = 0;
        mission_time_s = 0.0;
        mission_stage_index = 0;
        mission_stage_tick = 0;

        resetGovernance();

        history.clear();
        meas_history.clear();
        audit_chain.clear();
        last_seen_tick.clear();

        truth.reset();
        fused.reset();

        if (new_seed) {
            rng_seed = *new_seed;
        }
        run_id = wallClockMillis();
    }

    // Clears governance memory only.
    void resetGovernance() { clarity_ema = kInitialClarityEma; }

    /**
     * @brief ISO-8601 UTC timestamp of a tick: epoch + tick * dt_seconds,
     * formatted as YYYY-MM-DDTHH:MM:SS.ffffffZ.
     */
    std::string utcForTick(std::int64_t t) const {
        const auto offset_us = static_cast<long long>(
            std::llround(static_cast<double>(t) * config_.dt_seconds * 1e6));
        const boost::posix_time::ptime at = epoch + boost::posix_time::microseconds(offset_us);
        const boost::posix_time::time_duration tod = at.time_of_day();

        char clock[32];
        std::snprintf(clock, sizeof(clock), "T%02d:%02d:%02d.%06lldZ",
                      static_cast<int>(tod.hours()),
                      static_cast<int>(tod.minutes()),
                      static_cast<int>(tod.seconds()),
                      static_cast<long long>(tod.total_microseconds() % 1000000));
        return boost::gregorian::to_iso_extended_string(at.date()) + clock;
    }

    /**
     * @brief Sensors not heard from for stale_ticks or more, sorted by id.
     */
    std::vector<std::string> staleSensors() const {
        std::vector<std::string> stale;
        for (const auto& kv : last_seen_tick) {
            if (tick - kv.second >= config_.stale_ticks) {
                stale.push_back(kv.first);
            }
        }
        return stale;
    }

    const MissionStage& missionStage() const { return presets::missionStages().at(mission_stage_index); }

private:
    FusionConfig config_;

    static std::int64_t wallClockMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count();
    }

    static std::uint64_t wallClockSeed() {
        return static_cast<std::uint64_t>(
            std::chrono::system_clock::now().time_since_epoch().count());
    }
};

} // namespace reconfusion

#endif // RECONFUSION_ENGINE_STATE_HPP_
