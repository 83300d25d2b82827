#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "Service/MetricsService.hpp"
#include "Service/TrajectoryEncoder.hpp"
#include "TestTrajectories.hpp"

using namespace regen;
using service::TrajectoryEncoder;
using test::parseJson;

namespace {

    ErrorKind encodeFailure(const std::string& text) {
        const auto result = TrajectoryEncoder::encode(parseJson(text));
        if (result.ok()) throw std::runtime_error("expected encoding of " + text + " to fail");
        return result.error().kind();
    }

    service::MetricsOptions seededOptions() {
        service::MetricsOptions options;
        options.cascade.seed = 2024;
        return options;
    }

}  // namespace

// -----------------------------------------------------------------------------
// TrajectoryEncoder
// -----------------------------------------------------------------------------

TEST(TrajectoryEncoderTest, PosesWithRotationVectors) {
    const auto trajectory = TrajectoryEncoder::encode(parseJson(test::squareLoopJson())).value();
    const traj::Trajectory expected = test::squareLoop();
    ASSERT_EQ(trajectory.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) EXPECT_TRUE(trajectory[i].isApprox(expected[i], 1e-12));
    EXPECT_TRUE(trajectory.bounded());
    EXPECT_DOUBLE_EQ(trajectory.rMax(), 1.0);
}

TEST(TrajectoryEncoderTest, BareArrayOfPoses) {
    const auto trajectory = TrajectoryEncoder::encode(
        parseJson(R"([{"rotation": [0, 0, 0.2], "translation": [1, 2, 3]}])"), false, 5.0).value();
    ASSERT_EQ(trajectory.size(), 1u);
    EXPECT_FALSE(trajectory.bounded());
    EXPECT_TRUE(trajectory[0].translation().isApprox(Eigen::Vector3d(1.0, 2.0, 3.0)));
    EXPECT_NEAR(trajectory[0].vec().z(), 0.2, 1e-12);
}

TEST(TrajectoryEncoderTest, PosesWithRotationMatrix) {
    const auto trajectory = TrajectoryEncoder::encode(parseJson(R"({"poses": [
        {"rotation": [[0, -1, 0], [1, 0, 0], [0, 0, 1]], "translation": [0.1, 0, 0]}
    ]})")).value();
    EXPECT_NEAR(trajectory[0].vec().z(), M_PI / 2.0, 1e-12);
}

TEST(TrajectoryEncoderTest, PoseErrors) {
    EXPECT_EQ(encodeFailure(R"({"poses": [{"rotation": [0, 0, 0]}]})"), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(encodeFailure(R"({"poses": [{"rotation": [0, 0], "translation": [0, 0, 0]}]})"),
              ErrorKind::DimensionMismatch);
    EXPECT_EQ(encodeFailure(R"({"poses": [{"rotation": [0, "a", 0], "translation": [0, 0, 0]}]})"),
              ErrorKind::UnsupportedFormat);
    EXPECT_EQ(encodeFailure(R"({"poses": [{"rotation": [[2, 0, 0], [0, 1, 0], [0, 0, 1]], "translation": [0, 0, 0]}]})"),
              ErrorKind::InvalidPose);
    EXPECT_EQ(encodeFailure(R"({"poses": [{"rotation": [0, 0, 0], "translation": [2, 0, 0]}]})"),
              ErrorKind::BoundsViolation);
    EXPECT_EQ(encodeFailure(R"({"poses": []})"), ErrorKind::EmptyTrajectory);
}

TEST(TrajectoryEncoderTest, UnknownShapes) {
    EXPECT_EQ(encodeFailure(R"({"points": [[0, 0, 0]]})"), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(encodeFailure(R"({"positions": [[0, 0, 0]]})"), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(encodeFailure(R"(42)"), ErrorKind::UnsupportedFormat);
}

TEST(TrajectoryEncoderTest, TimeSeriesBecomesIncrements) {
    const auto trajectory = TrajectoryEncoder::encode(parseJson(R"({
        "positions": [[0.1, 0, 0], [0.3, 0, 0], [0.3, 0.2, 0]],
        "orientations": [[0.5, 0, 0], [0.5, 0, 0.1], [0.5, 0, 0.3]]
    })")).value();
    ASSERT_EQ(trajectory.size(), 3u);
    EXPECT_TRUE(trajectory[0].rotation().isIdentity());
    EXPECT_TRUE(trajectory[0].translation().isApprox(Eigen::Vector3d(0.1, 0.0, 0.0)));
    EXPECT_TRUE(trajectory[1].translation().isApprox(Eigen::Vector3d(0.2, 0.0, 0.0)));
    EXPECT_TRUE(trajectory[1].vec().isApprox(Eigen::Vector3d(0.0, 0.0, 0.1), 1e-9));
    EXPECT_TRUE(trajectory[2].translation().isApprox(Eigen::Vector3d(0.0, 0.2, 0.0)));
    EXPECT_TRUE(trajectory[2].vec().isApprox(Eigen::Vector3d(0.0, 0.0, 0.2), 1e-9));
}

TEST(TrajectoryEncoderTest, TimeSeriesAcceptsQuaternionRows) {
    const auto trajectory = TrajectoryEncoder::encode(parseJson(R"({
        "positions": [[0, 0, 0], [0.1, 0, 0]],
        "orientations": [[0, 0, 0, 1], [0, 0, 0.1, 0.99]]
    })")).value();
    EXPECT_TRUE(trajectory[1].vec().isApprox(Eigen::Vector3d(0.0, 0.0, 0.1), 1e-9));
}

TEST(TrajectoryEncoderTest, TimeSeriesErrors) {
    EXPECT_EQ(encodeFailure(R"({"positions": [[0, 0, 0], [1, 0, 0]], "orientations": [[0, 0, 0]]})"),
              ErrorKind::DimensionMismatch);
    EXPECT_EQ(encodeFailure(R"({"positions": [[0, 0, 0]], "orientations": [[0, 0]]})"),
              ErrorKind::DimensionMismatch);
}

TEST(TrajectoryEncoderTest, StateVectors) {
    const auto trajectory = TrajectoryEncoder::encode(parseJson(R"({
        "state_vectors": [[0, 0, 0.1, 0.2, 0, 0, 9, 9], [0, 0, 0, 0, 0.3, 0]]
    })")).value();
    ASSERT_EQ(trajectory.size(), 2u);
    EXPECT_TRUE(trajectory[0].vec().isApprox(Eigen::Vector3d(0.0, 0.0, 0.1), 1e-9));
    EXPECT_TRUE(trajectory[0].translation().isApprox(Eigen::Vector3d(0.2, 0.0, 0.0)));
    EXPECT_TRUE(trajectory[1].translation().isApprox(Eigen::Vector3d(0.0, 0.3, 0.0)));

    EXPECT_EQ(encodeFailure(R"({"state_vectors": [[0, 0, 0, 0, 0]]})"), ErrorKind::DimensionMismatch);
}

// -----------------------------------------------------------------------------
// MetricsOptions
// -----------------------------------------------------------------------------

TEST(MetricsOptionsTest, ReadsRequestOptions) {
    const auto options = service::MetricsOptions::FromJson(parseJson(R"({
        "enable_resonance_detection": false, "bounded": false, "r_max": 2.5,
        "lambda_bounds": [0.5, 1.5], "seed": 17
    })"));
    EXPECT_FALSE(options.enable_resonance_detection);
    EXPECT_TRUE(options.enable_verification_cascade);
    EXPECT_FALSE(options.bounded);
    EXPECT_DOUBLE_EQ(options.r_max, 2.5);
    EXPECT_DOUBLE_EQ(options.lambda_bounds.lower, 0.5);
    EXPECT_DOUBLE_EQ(options.lambda_bounds.upper, 1.5);
    ASSERT_TRUE(options.cascade.seed.has_value());
    EXPECT_EQ(*options.cascade.seed, 17u);
}

TEST(MetricsOptionsTest, MissingOptionsKeepDefaults) {
    const auto options = service::MetricsOptions::FromJson(Json::Value());
    EXPECT_TRUE(options.bounded);
    EXPECT_DOUBLE_EQ(options.lambda_bounds.lower, 0.1);
    EXPECT_DOUBLE_EQ(options.lambda_bounds.upper, 2.0);
    EXPECT_FALSE(options.cascade.seed.has_value());
}

TEST(MetricsOptionsTest, RejectsMistypedOptions) {
    EXPECT_THROW(service::MetricsOptions::FromJson(parseJson(R"({"bounded": "yes"})")), Error);
    EXPECT_THROW(service::MetricsOptions::FromJson(parseJson(R"({"lambda_bounds": [1]})")), Error);
    EXPECT_THROW(service::MetricsOptions::FromJson(parseJson(R"({"seed": -4})")), Error);
}

// -----------------------------------------------------------------------------
// MetricsService
// -----------------------------------------------------------------------------

TEST(MetricsServiceTest, SquareLoopEndToEnd) {
    const service::MetricsService metrics_service(seededOptions());
    const auto metrics = metrics_service.computeMetrics(parseJson(test::squareLoopJson()));

    EXPECT_GE(metrics.optimal_lambda, 0.1);
    EXPECT_LE(metrics.optimal_lambda, 2.0);
    EXPECT_GE(metrics.return_error_epsilon, 0.0);
    EXPECT_GE(metrics.verification_score, 0.0);
    EXPECT_LE(metrics.verification_score, 1.0);
    EXPECT_GT(metrics.confidence, 0.0);
    EXPECT_LE(metrics.confidence, 1.0);

    EXPECT_EQ(metrics.metadata.trajectory_length, 4u);
    EXPECT_TRUE(metrics.metadata.bounded);
    EXPECT_DOUBLE_EQ(metrics.metadata.r_max, 1.0);
    EXPECT_GT(metrics.metadata.optimization_evaluations, 0u);
    if (metrics.metadata.optimization_success) {
        EXPECT_DOUBLE_EQ(metrics.confidence, std::min(1.0, 1.0 / (1.0 + metrics.return_error_epsilon)));
    }

    const auto again = metrics_service.computeMetrics(parseJson(test::squareLoopJson()));
    EXPECT_EQ(again.optimal_lambda, metrics.optimal_lambda);
    EXPECT_EQ(again.verification_score, metrics.verification_score);
    EXPECT_EQ(again.resonance_detected, metrics.resonance_detected);
}

TEST(MetricsServiceTest, DisabledStagesAreSkipped) {
    service::MetricsOptions options = seededOptions();
    options.enable_resonance_detection = false;
    options.enable_verification_cascade = false;
    const auto metrics = service::MetricsService(options).computeMetrics(parseJson(test::squareLoopJson()));
    EXPECT_EQ(metrics.verification_score, 0.0);
    EXPECT_FALSE(metrics.resonance_detected.has_value());
}

TEST(MetricsServiceTest, InvalidDataThrows) {
    const service::MetricsService metrics_service(seededOptions());
    try {
        metrics_service.computeMetrics(parseJson(R"({"poses": []})"));
        FAIL() << "expected regen::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyTrajectory);
    }
}

TEST(MetricsServiceTest, BatchIsolatesFailures) {
    Json::Value batch(Json::arrayValue);
    batch.append(parseJson(test::squareLoopJson()));
    batch.append(parseJson(R"({"state_vectors": [[0.1, 0, 0, 0.2, 0, 0], [0, 0.1, 0, 0, 0.2, 0]]})"));
    batch.append(parseJson(R"({"poses": []})"));

    const service::MetricsService metrics_service(seededOptions());
    const auto entries = metrics_service.computeBatch(batch);
    ASSERT_EQ(entries.size(), 3u);
    for (std::size_t i = 0; i < entries.size(); ++i) EXPECT_EQ(entries[i].index, i);

    EXPECT_TRUE(entries[0].ok());
    EXPECT_TRUE(entries[1].ok());
    ASSERT_FALSE(entries[2].ok());
    ASSERT_TRUE(entries[2].error.has_value());
    EXPECT_EQ(entries[2].error->kind(), ErrorKind::EmptyTrajectory);

    const Json::Value json = service::toJson(entries);
    ASSERT_EQ(json.size(), 3u);
    EXPECT_EQ(json[2]["trajectory_index"].asUInt64(), 2u);
    EXPECT_EQ(json[2]["error_kind"].asString(), "EmptyTrajectory");
    EXPECT_TRUE(json[0].isMember("optimal_lambda"));
    EXPECT_EQ(json[0]["metadata"]["trajectory_length"].asUInt64(), 4u);
}

TEST(MetricsServiceTest, BatchRequiresArray) {
    EXPECT_THROW(service::MetricsService().computeBatch(parseJson(R"({"poses": []})")), Error);
}

TEST(MetricsServiceTest, ConfidenceDegradesWithoutConvergence) {
    EXPECT_DOUBLE_EQ(service::confidenceFrom(0.0, true), 1.0);
    EXPECT_DOUBLE_EQ(service::confidenceFrom(1.0, true), 0.5);
    EXPECT_DOUBLE_EQ(service::confidenceFrom(0.01, false), 0.5);

    service::MetricsOptions options = seededOptions();
    options.solver.max_evaluations = 2;
    const auto metrics = service::MetricsService(options).computeMetrics(parseJson(test::squareLoopJson()));
    EXPECT_FALSE(metrics.metadata.optimization_success);
    EXPECT_DOUBLE_EQ(metrics.confidence, 0.5);
}

TEST(MetricsServiceTest, MetricsSerialization) {
    service::RegenerativeMetrics metrics;
    metrics.optimal_lambda = 0.75;
    metrics.resonance_detected = std::string("golden_ratio");
    metrics.metadata.lambda_bounds = {0.2, 1.8};
    const Json::Value json = service::toJson(metrics);
    EXPECT_DOUBLE_EQ(json["optimal_lambda"].asDouble(), 0.75);
    EXPECT_EQ(json["resonance_detected"].asString(), "golden_ratio");
    EXPECT_DOUBLE_EQ(json["metadata"]["lambda_bounds"][1].asDouble(), 1.8);

    metrics.resonance_detected.reset();
    EXPECT_TRUE(service::toJson(metrics)["resonance_detected"].isNull());
}

TEST(MetricsServiceTest, VerboseLogging) {
    std::ostringstream log;
    service::MetricsOptions options = seededOptions();
    options.verbose = true;
    options.log_stream = &log;
    service::MetricsService(options).computeMetrics(parseJson(test::squareLoopJson()));
    EXPECT_NE(log.str().find("[MetricsService::computeMetrics]"), std::string::npos);
}
