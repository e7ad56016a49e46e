#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/circular_buffer.hpp>

#include "fusion_config.hpp"
#include "fusion_consistency.hpp"
#include "fusion_engine.hpp"
#include "test_helpers.hpp"

using namespace reconfusion;
using testing_helpers::makePosition;
using testing_helpers::makeTimed;

namespace {

std::vector<std::string> ids(const std::vector<SensorMeasurement>& ms) {
    std::vector<std::string> out;
    for (const auto& m : ms) {
        out.push_back(m.sensorId());
    }
    return out;
}

} // namespace

// ============================================================================
// Time gate
// ============================================================================

TEST(FusionEngineGate, SelectsMeasurementsYoungerThanGate) {
    FusionEngine engine(FusionConfig{});
    // Chronological order: oldest (largest age) first
    std::vector<SensorMeasurement> history = {
        makeTimed("AGE_400", 10, 400.0),
        makeTimed("AGE_100", 10, 100.0),
        makeTimed("AGE_0", 10, 0.0),
    };
    std::vector<SensorMeasurement> selected = engine.selectMeasurements(history, 10);
    EXPECT_EQ(ids(selected), (std::vector<std::string>{"AGE_0", "AGE_100"}));
}

TEST(FusionEngineGate, GateBoundaryIsInclusive) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {makeTimed("EDGE", 5, 350.0)};
    EXPECT_EQ(engine.selectMeasurements(history, 5).size(), 1u);

    std::vector<SensorMeasurement> beyond = {makeTimed("BEYOND", 5, 350.001)};
    EXPECT_TRUE(engine.selectMeasurements(beyond, 5).empty());
}

TEST(FusionEngineGate, DroppedEntriesAreSkippedWithoutEndingTheScan) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {
        makeTimed("A", 10, 0.0),
        makeTimed("DROPPED", 10, 2000.0, true),
        makeTimed("C", 10, 0.0),
    };
    EXPECT_EQ(ids(engine.selectMeasurements(history, 10)), (std::vector<std::string>{"C", "A"}));
}

TEST(FusionEngineGate, FirstOutOfGateEntryEndsTheScan) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {
        makeTimed("A", 10, 0.0),
        makeTimed("SLOW", 10, 400.0),
        makeTimed("C", 10, 0.0),
    };
    EXPECT_EQ(ids(engine.selectMeasurements(history, 10)), (std::vector<std::string>{"C"}));
}

TEST(FusionEngineGate, GnssFixAgesOutAfterOneTick) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {makeTimed("GNSS_A", 12, 90.0)};
    EXPECT_EQ(engine.selectMeasurements(history, 12).size(), 1u);
    EXPECT_TRUE(engine.selectMeasurements(history, 13).empty());
}

TEST(FusionEngineGate, AgeUsesTickDurationAndLatency) {
    FusionConfig config;
    config.dt_seconds = 0.1;
    FusionEngine engine(config);
    SensorMeasurement m = makeTimed("GNSS_A", 10, 50.0);
    EXPECT_NEAR(engine.ageMs(m, 12), 250.0, 1e-9);
    EXPECT_NEAR(engine.ageMs(m, 10), 50.0, 1e-9);
}

TEST(FusionEngineGate, PendingMeasurementsBehaveAsIfAppended) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {makeTimed("OLD", 9, 0.0), makeTimed("PREV", 10, 0.0)};
    std::vector<SensorMeasurement> pending = {makeTimed("NEW_1", 10, 10.0), makeTimed("NEW_2", 10, 20.0)};

    std::vector<SensorMeasurement> appended = history;
    appended.insert(appended.end(), pending.begin(), pending.end());

    EXPECT_EQ(ids(engine.selectMeasurements(history, 10, pending)),
              ids(engine.selectMeasurements(appended, 10)));
}

TEST(FusionEngineGate, ScanNeverReachesPastBufferCapacity) {
    FusionConfig config;
    config.max_measurement_history = 2;
    FusionEngine engine(config);
    std::vector<SensorMeasurement> history = {makeTimed("EVICTED", 10, 0.0), makeTimed("KEPT", 10, 0.0)};
    std::vector<SensorMeasurement> pending = {makeTimed("NEW", 10, 0.0)};
    EXPECT_EQ(ids(engine.selectMeasurements(history, 10, pending)), (std::vector<std::string>{"NEW", "KEPT"}));
}

TEST(FusionEngineGate, WorksOnRingBuffersAndDeques) {
    FusionEngine engine(FusionConfig{});
    boost::circular_buffer<SensorMeasurement> ring(2);
    ring.push_back(makeTimed("A", 1, 0.0));
    ring.push_back(makeTimed("B", 2, 0.0));
    ring.push_back(makeTimed("C", 2, 10.0));
    EXPECT_EQ(ids(engine.selectMeasurements(ring, 2)), (std::vector<std::string>{"C", "B"}));

    std::deque<SensorMeasurement> dq = {makeTimed("D", 3, 0.0)};
    EXPECT_EQ(engine.selectMeasurements(dq, 3).size(), 1u);
}

// ============================================================================
// Strategy dispatch
// ============================================================================

TEST(FusionEngineStrategy, DefaultsToWeighted) {
    FusionEngine engine(FusionConfig{});
    EXPECT_STREQ(engine.strategy().getName(), "weighted");
}

TEST(FusionEngineStrategy, UnknownNameFallsBackToWeighted) {
    FusionEngine engine(FusionConfig{}, "particle");
    EXPECT_STREQ(engine.strategy().getName(), "weighted");
    EXPECT_FALSE(engine.setStrategy("does-not-exist"));
    EXPECT_STREQ(engine.strategy().getName(), "weighted");
    EXPECT_TRUE(engine.setStrategy("weighted"));
}

TEST(FusionEngineStrategy, KalmanSelectionIsHonouredAndFails) {
    FusionEngine engine(FusionConfig{});
    EXPECT_TRUE(engine.setStrategy("kalman"));
    EXPECT_STREQ(engine.strategy().getName(), "kalman");
    std::vector<SensorMeasurement> history = {makeTimed("GNSS_A", 1, 0.0)};
    EXPECT_THROW(engine.fuse(history, 1), std::runtime_error);
}

TEST(FusionEngineStrategy, EmptyHistoryGivesFallbackEstimate) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history;
    FusionResult result = engine.fuse(history, 1);
    EXPECT_TRUE(result.used.empty());
    EXPECT_DOUBLE_EQ(result.estimate.fusionConf(), 0.1);
    EXPECT_DOUBLE_EQ(result.estimate.surprise(), 1.0);
    EXPECT_TRUE(result.estimate.sensorContrib().empty());
    EXPECT_EQ(result.estimate.usedMeasCount(), 0);
    EXPECT_TRUE(result.consistency.consistent);
}

TEST(FusionEngineStrategy, FuseUsesOnlyGatedMeasurements) {
    FusionEngine engine(FusionConfig{});
    std::vector<SensorMeasurement> history = {
        makePosition("STALE", SensorType::RADAR, 1, Eigen::Vector3d(10.0, 10.0, 10.0)),
        makePosition("GNSS_A", SensorType::GNSS, 2, Eigen::Vector3d(50.0, 36.0, 1000.0)),
    };
    FusionResult result = engine.fuse(history, 2);
    ASSERT_EQ(result.used.size(), 1u);
    EXPECT_EQ(result.estimate.usedMeasCount(), 1);
    EXPECT_DOUBLE_EQ(result.estimate.lat(), 50.0);
    EXPECT_EQ(result.estimate.sensorContrib().count("STALE"), 0u);
}

// ============================================================================
// Consistency check
// ============================================================================

TEST(FusionConsistency, SingleMeasurementIsTriviallyConsistent) {
    FusionConsistencyChecker checker;
    std::vector<SensorMeasurement> ms = {
        makePosition("GNSS_A", SensorType::GNSS, 1, Eigen::Vector3d(1.0, 2.0, 3.0)),
    };
    FusedEstimate fused(1.0, 2.0, 3.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {{"GNSS_A", 1.0}}, 1);
    ConsistencyResult r = checker.check(ms, fused);
    EXPECT_DOUBLE_EQ(r.nis, 0.0);
    EXPECT_EQ(r.degrees_of_freedom, 0);
    EXPECT_TRUE(r.consistent);
}

TEST(FusionConsistency, ModerateSpreadIsConsistent) {
    FusionConsistencyChecker checker;
    std::vector<SensorMeasurement> ms = {
        makePosition("A", SensorType::GNSS, 1, Eigen::Vector3d(0.0, 0.0, 0.0)),
        makePosition("B", SensorType::GNSS, 1, Eigen::Vector3d(2.0, 0.0, 0.0)),
    };
    FusedEstimate fused(1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {{"A", 0.5}, {"B", 0.5}}, 2);
    ConsistencyResult r = checker.check(ms, fused);
    EXPECT_NEAR(r.nis, 2.0, 1e-12);
    EXPECT_EQ(r.degrees_of_freedom, 3);
    EXPECT_TRUE(r.consistent);
}

TEST(FusionConsistency, LargeDisagreementIsInconsistent) {
    FusionConsistencyChecker checker;
    std::vector<SensorMeasurement> ms = {
        makePosition("A", SensorType::GNSS, 1, Eigen::Vector3d(0.0, 0.0, 0.0)),
        makePosition("B", SensorType::RADAR, 1, Eigen::Vector3d(20.0, 0.0, 0.0)),
    };
    FusedEstimate fused(10.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {{"A", 0.5}, {"B", 0.5}}, 2);
    ConsistencyResult r = checker.check(ms, fused);
    EXPECT_NEAR(r.nis, 200.0, 1e-9);
    EXPECT_FALSE(r.consistent);
}

TEST(FusionConsistency, SingularCovarianceIsSkipped) {
    FusionConsistencyChecker checker;
    std::vector<SensorMeasurement> ms = {
        makePosition("A", SensorType::GNSS, 1, Eigen::Vector3d(0.0, 0.0, 0.0)),
        makePosition("B", SensorType::GNSS, 1, Eigen::Vector3d(2.0, 0.0, 0.0)),
        makePosition("SINGULAR", SensorType::EOIR, 1, Eigen::Vector3d(1.0, 0.0, 0.0), 0.0),
    };
    FusedEstimate fused(1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5,
                        {{"A", 0.4}, {"B", 0.4}, {"SINGULAR", 0.2}}, 3);
    ConsistencyResult r = checker.check(ms, fused);
    EXPECT_EQ(r.degrees_of_freedom, 3);
    EXPECT_NEAR(r.nis, 2.0, 1e-12);
}

TEST(FusionConsistency, ChiSquaredBounds) {
    FusionConsistencyChecker checker(0.01, 0.99);
    // chi2(3): 1% quantile ~0.115, 99% quantile ~11.34
    EXPECT_FALSE(checker.checkConsistency(0.05, 3));
    EXPECT_TRUE(checker.checkConsistency(3.0, 3));
    EXPECT_FALSE(checker.checkConsistency(12.0, 3));
    EXPECT_TRUE(checker.checkConsistency(123.0, 0));
}
