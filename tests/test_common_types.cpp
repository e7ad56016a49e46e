#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

#include "common_types.hpp"
#include "test_helpers.hpp"

using namespace reconfusion;
using testing_helpers::makePosition;

namespace {

SensorMeasurement makeRaw(Eigen::VectorXd z, Eigen::MatrixXd R,
                          double quality = 0.5, double latency = 10.0,
                          std::int64_t tick = 1, const std::string& id = "GNSS_A") {
    return SensorMeasurement(tick, "2026-01-01T00:00:01.000000Z", id, SensorType::GNSS,
                             std::move(z), std::move(R), quality, latency);
}

} // namespace

// ============================================================================
// SensorMeasurement
// ============================================================================

TEST(SensorMeasurement, ValidConstructionExposesFields) {
    SensorMeasurement m = makePosition("EOIR_1", SensorType::EOIR, 7, Eigen::Vector3d(1.0, 2.0, 3.0),
                                       4.0, 0.6, 120.0, false, {{"hot_ratio", 0.2}});
    EXPECT_EQ(m.tick(), 7);
    EXPECT_EQ(m.sensorId(), "EOIR_1");
    EXPECT_EQ(m.sensorType(), SensorType::EOIR);
    EXPECT_DOUBLE_EQ(m.z()(2), 3.0);
    EXPECT_DOUBLE_EQ(m.R().trace(), 12.0);
    EXPECT_DOUBLE_EQ(m.quality(), 0.6);
    EXPECT_DOUBLE_EQ(m.latencyMs(), 120.0);
    EXPECT_FALSE(m.dropped());
    EXPECT_DOUBLE_EQ(m.metaNumber("hot_ratio", -1.0), 0.2);
}

TEST(SensorMeasurement, MetaNumberFallsBackForMissingOrTextValues) {
    SensorMeasurement m = makePosition("GNSS_A", SensorType::GNSS, 1, Eigen::Vector3d::Zero(),
                                       1.0, 0.0, 100.0, true,
                                       {{"dropped_reason", std::string("synthetic_jam_drop")}});
    EXPECT_DOUBLE_EQ(m.metaNumber("dropped_reason", 4.0), 4.0);
    EXPECT_DOUBLE_EQ(m.metaNumber("absent", -2.0), -2.0);
}

TEST(SensorMeasurement, RejectsEmptyMeasurementVector) {
    EXPECT_THROW(makeRaw(Eigen::VectorXd(0), Eigen::MatrixXd(0, 0)), std::runtime_error);
}

TEST(SensorMeasurement, RejectsNonSquareCovariance) {
    EXPECT_THROW(makeRaw(Eigen::Vector3d::Zero(), Eigen::MatrixXd::Zero(3, 2)), std::runtime_error);
}

TEST(SensorMeasurement, RejectsCovarianceDimensionMismatch) {
    EXPECT_THROW(makeRaw(Eigen::Vector3d::Zero(), Eigen::MatrixXd::Identity(2, 2)), std::runtime_error);
}

TEST(SensorMeasurement, RejectsNonFiniteValues) {
    Eigen::Vector3d z(0.0, std::numeric_limits<double>::quiet_NaN(), 0.0);
    EXPECT_THROW(makeRaw(z, Eigen::MatrixXd::Identity(3, 3)), std::runtime_error);

    Eigen::MatrixXd R = Eigen::MatrixXd::Identity(3, 3);
    R(1, 1) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(makeRaw(Eigen::Vector3d::Zero(), R), std::runtime_error);
}

TEST(SensorMeasurement, PositionSensorsNeedThreeComponents) {
    const Eigen::Vector2d z2(50.0, 36.0);
    const Eigen::MatrixXd R2 = Eigen::MatrixXd::Identity(2, 2);
    for (SensorType type : {SensorType::GNSS, SensorType::EOIR, SensorType::RADAR}) {
        EXPECT_THROW(SensorMeasurement(1, "2026-01-01T00:00:01.000000Z", "POS", type, z2, R2, 0.5, 10.0),
                     std::runtime_error);
    }
    EXPECT_NO_THROW(SensorMeasurement(1, "2026-01-01T00:00:01.000000Z", "LINK_1", SensorType::LINK,
                                      Eigen::VectorXd::Constant(1, 120.0), Eigen::MatrixXd::Identity(1, 1),
                                      0.9, 120.0));
    EXPECT_TRUE(isPositionType(SensorType::RADAR));
    EXPECT_FALSE(isPositionType(SensorType::BARO));
}

TEST(SensorMeasurement, RejectsOutOfRangeScalars) {
    const Eigen::Vector3d z = Eigen::Vector3d::Zero();
    const Eigen::MatrixXd R = Eigen::MatrixXd::Identity(3, 3);
    EXPECT_THROW(makeRaw(z, R, 1.01), std::runtime_error);
    EXPECT_THROW(makeRaw(z, R, -0.01), std::runtime_error);
    EXPECT_THROW(makeRaw(z, R, 0.5, -1.0), std::runtime_error);
    EXPECT_THROW(makeRaw(z, R, 0.5, 10.0, -1), std::runtime_error);
    EXPECT_THROW(makeRaw(z, R, 0.5, 10.0, 1, ""), std::runtime_error);
    EXPECT_NO_THROW(makeRaw(z, R, 0.0, 0.0, 0));
    EXPECT_NO_THROW(makeRaw(z, R, 1.0, 0.0, 0));
}

// ============================================================================
// FusedEstimate
// ============================================================================

TEST(FusedEstimate, AcceptsNormalizedContributions) {
    FusedEstimate f(49.99, 36.23, 1200.0, 0.0, 0.0, 40.0, 0.3, 0.8, 0.2,
                    {{"GNSS_A", 0.6}, {"EOIR_1", 0.3}, {"RADAR_1", 0.1}}, 3);
    EXPECT_DOUBLE_EQ(f.lat(), 49.99);
    EXPECT_EQ(f.usedMeasCount(), 3);
    EXPECT_EQ(f.sensorContrib().size(), 3u);
    EXPECT_TRUE(f.position().isApprox(Eigen::Vector3d(49.99, 36.23, 1200.0)));
}

TEST(FusedEstimate, EmptyContributionsAreValid) {
    EXPECT_NO_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.1, 1.0, {}, 0));
}

TEST(FusedEstimate, RejectsContributionsNotSummingToOne) {
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5,
                               {{"GNSS_A", 0.6}, {"EOIR_1", 0.3}}, 2),
                 std::runtime_error);
}

TEST(FusedEstimate, RejectsNegativeContribution) {
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5,
                               {{"GNSS_A", 1.2}, {"EOIR_1", -0.2}}, 2),
                 std::runtime_error);
}

TEST(FusedEstimate, RejectsOutOfRangeFields) {
    EXPECT_THROW(FusedEstimate(91.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {}, 0), std::runtime_error);
    EXPECT_THROW(FusedEstimate(0.0, 181.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {}, 0), std::runtime_error);
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 60000.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {}, 0), std::runtime_error);
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 361.0, 0.0, 0.0, 0.5, 0.5, {}, 0), std::runtime_error);
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 1.5, 0.5, {}, 0), std::runtime_error);
    EXPECT_THROW(FusedEstimate(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.5, 0.5, {}, -1), std::runtime_error);
}

// ============================================================================
// Telemetry
// ============================================================================

TEST(Telemetry, DefaultValuesAreValid) {
    Telemetry t{Telemetry::Values{}};
    EXPECT_EQ(t.tick(), 0);
    EXPECT_EQ(t.state(), SystemState::STABLE);
}

TEST(Telemetry, RejectsOutOfRangeGovernanceAndPhysics) {
    Telemetry::Values v;
    v.clarity = 100.5;
    EXPECT_THROW(Telemetry{v}, std::runtime_error);

    v = Telemetry::Values{};
    v.mach = 5.5;
    EXPECT_THROW(Telemetry{v}, std::runtime_error);

    v = Telemetry::Values{};
    v.cc_threat_factor = -0.1;
    EXPECT_THROW(Telemetry{v}, std::runtime_error);

    v = Telemetry::Values{};
    v.envelope_pressure = 2.1;
    EXPECT_THROW(Telemetry{v}, std::runtime_error);

    v = Telemetry::Values{};
    v.tick = -3;
    EXPECT_THROW(Telemetry{v}, std::runtime_error);
}

TEST(EnumNames, SensorAndStateNames) {
    EXPECT_STREQ(toString(SensorType::EOIR), "EOIR");
    EXPECT_STREQ(toString(SensorType::LINK), "LINK");
    EXPECT_STREQ(toString(SystemState::HIGH_RISK), "HIGH_RISK");
}
