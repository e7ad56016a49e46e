// fusion_engine.hpp
#ifndef RECONFUSION_FUSION_ENGINE_HPP_
#define RECONFUSION_FUSION_ENGINE_HPP_

#include <cmath>     // For std::abs
#include <cstddef>   // For std::size_t
#include <cstdint>   // For std::int64_t
#include <map>       // For the strategy registry
#include <memory>    // For std::unique_ptr
#include <string>
#include <vector>

#include <boost/log/trivial.hpp>

// Project Specific Includes
#include "common_types.hpp"
#include "fusion_config.hpp"
#include "fusion_consistency.hpp"
#include "fusion_strategies.hpp"

namespace reconfusion {

/**
 * @brief Everything one fusion pass produced.
 */
struct FusionResult {
    std::vector<SensorMeasurement> used; // Time-gated selection, most recent first
    FusedEstimate estimate;
    ConsistencyResult consistency;
};

/**
 * @brief The FusionEngine selects the time-gated measurement subset for a tick
 * and dispatches it to the active fusion strategy.
 *
 * Strategies are registered by name ("weighted", "kalman"). Requesting an
 * unknown name selects the weighted strategy and logs a warning. Requesting
 * "kalman" is honoured, so fusing with it fails loudly.
 */
class FusionEngine {
public:
    static constexpr const char* kDefaultStrategy = "weighted";

    /**
     * @param config Fusion configuration (time gate, dt, weights, consistency alphas).
     * @param strategy_name Initially active strategy.
     */
    explicit FusionEngine(const FusionConfig& config, const std::string& strategy_name = kDefaultStrategy)
        : config_(config),
          consistency_checker_(config.consistency_alpha_lower, config.consistency_alpha_upper) {
        strategies_["weighted"] = std::make_unique<WeightedFusion>(config_);
        strategies_["kalman"] = std::make_unique<KalmanFusion>();
        setStrategy(strategy_name);
    }

    /**
     * @brief Activates a strategy by name. Repeating the current request is a no-op.
     * @return True if the name was known, false if the default was substituted.
     */
    bool setStrategy(const std::string& name) {
        if (active_ != nullptr && name == requested_name_) {
            return strategies_.count(name) > 0;
        }
        requested_name_ = name;
        auto it = strategies_.find(name);
        if (it == strategies_.end()) {
            BOOST_LOG_TRIVIAL(warning) << "Unknown fusion strategy '" << name
                                       << "', falling back to '" << kDefaultStrategy << "'.";
            active_ = strategies_.at(kDefaultStrategy).get();
            return false;
        }
        active_ = it->second.get();
        return true;
    }

    const FusionStrategy& strategy() const { return *active_; }

    const FusionConfig& config() const { return config_; }

    /**
     * @brief Age of a measurement relative to the current tick, in milliseconds.
     * age_ms = |(current_tick - m.tick) * dt_seconds * 1000 + latency_ms|
     */
    double ageMs(const SensorMeasurement& m, std::int64_t current_tick) const {
        double tick_delta = static_cast<double>(current_tick - m.tick());
        return std::abs(tick_delta * config_.dt_seconds * 1000.0 + m.latencyMs());
    }

    /**
     * @brief Selects usable measurements within the fusion time gate.
     *
     * The history is scanned most recent first. Dropped entries are skipped
     * without ending the scan; the first non-dropped entry outside the gate
     * ends it. The gate is inclusive.
     *
     * @tparam History Any chronologically ordered container with reverse iterators
     * (boost::circular_buffer, std::vector, std::deque).
     * @param history Measurements already recorded, oldest first.
     * @param current_tick The tick being fused.
     * @param pending Measurements not yet appended to history (newer than all of it).
     * The scan behaves as if they had been appended to a buffer holding at most
     * max_measurement_history entries.
     */
    template<typename History>
    std::vector<SensorMeasurement> selectMeasurements(const History& history,
                                                      std::int64_t current_tick,
                                                      const std::vector<SensorMeasurement>& pending = {}) const {
        std::vector<SensorMeasurement> selected;
        std::size_t remaining = config_.max_measurement_history;
        if (scanGate(pending.rbegin(), pending.rend(), current_tick, remaining, selected)) {
            scanGate(history.rbegin(), history.rend(), current_tick, remaining, selected);
        }
        return selected;
    }

    /**
     * @brief Selects the gated subset and fuses it with the active strategy.
     * @throws std::runtime_error if the active strategy cannot fuse (e.g., the Kalman placeholder).
     */
    template<typename History>
    FusionResult fuse(const History& history,
                      std::int64_t current_tick,
                      const std::vector<SensorMeasurement>& pending = {}) const {
        std::vector<SensorMeasurement> used = selectMeasurements(history, current_tick, pending);
        FusedEstimate estimate = active_->fuse(used);
        ConsistencyResult consistency = consistency_checker_.check(used, estimate);

        BOOST_LOG_TRIVIAL(debug) << "Tick " << current_tick << ": " << active_->getName()
                                 << " fused " << estimate.usedMeasCount() << " of " << used.size()
                                 << " gated measurements, conf=" << estimate.fusionConf()
                                 << " nis=" << consistency.nis;

        return FusionResult{std::move(used), std::move(estimate), consistency};
    }

private:
    FusionConfig config_;
    FusionConsistencyChecker consistency_checker_;
    std::map<std::string, std::unique_ptr<FusionStrategy>> strategies_;
    const FusionStrategy* active_ = nullptr;
    std::string requested_name_;

    // Returns false once the scan must stop (entry outside the gate or buffer capacity reached).
    template<typename ReverseIt>
    bool scanGate(ReverseIt first, ReverseIt last, std::int64_t current_tick,
                  std::size_t& remaining, std::vector<SensorMeasurement>& selected) const {
        for (; first != last; ++first) {
            if (remaining == 0) {
                return false;
            }
            --remaining;
            const SensorMeasurement& m = *first;
            if (m.dropped()) {
                continue;
            }
            if (ageMs(m, current_tick) > config_.fusion_time_gate_ms) {
                return false;
            }
            selected.push_back(m);
        }
        return true;
    }
};

} // namespace reconfusion

#endif // RECONFUSION_FUSION_ENGINE_HPP_
