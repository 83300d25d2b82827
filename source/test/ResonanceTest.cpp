#include <algorithm>
#include <stdexcept>

#include <gtest/gtest.h>

#include "Resonance/ResonanceAwareOptimizer.hpp"
#include "Resonance/ResonanceDetector.hpp"
#include "Trajectory/Generators.hpp"
#include "TestTrajectories.hpp"

using namespace regen;

namespace {

    std::vector<traj::Trajectory> sampleTrajectories() {
        std::vector<traj::Trajectory> samples{test::squareLoop(), test::selfCancelling()};
        for (std::uint64_t seed = 1; seed <= 4; ++seed) {
            samples.push_back(traj::generateRandomTrajectory(6, 1.0, 0.3, false, seed).value());
        }
        return samples;
    }

}  // namespace

// -----------------------------------------------------------------------------
// ResonanceDetector
// -----------------------------------------------------------------------------

TEST(ResonanceDetectorTest, ConstantsInComparisonOrder) {
    const auto constants = resonance::standardConstants();
    ASSERT_EQ(constants.size(), 7u);
    EXPECT_EQ(constants.front().name, "golden_ratio");
    EXPECT_NEAR(constants.front().value, 0.618034, 1e-6);
    EXPECT_EQ(constants.back().name, "major_third");
    EXPECT_DOUBLE_EQ(constants.back().value, 1.25);
}

TEST(ResonanceDetectorTest, NaturalFlagMatchesDefinition) {
    const resonance::ResonanceDetector detector;
    for (const auto& trajectory : sampleTrajectories()) {
        const auto detection = detector.detect(trajectory);
        ASSERT_EQ(detection.all_resonances.size(), 7u);

        double min_error = detection.all_resonances.front().second;
        for (const auto& entry : detection.all_resonances) min_error = std::min(min_error, entry.second);
        EXPECT_DOUBLE_EQ(detection.best_error, min_error);

        const bool within = detection.best_error <= detection.optimal_error * (1.0 + 0.1);
        EXPECT_EQ(detection.is_natural, within);
    }
}

TEST(ResonanceDetectorTest, ErrorsMatchTestScaling) {
    const resonance::ResonanceDetector detector;
    const traj::Trajectory loop = test::squareLoop();
    const auto detection = detector.detect(loop);
    const auto constants = resonance::standardConstants();
    for (std::size_t i = 0; i < constants.size(); ++i) {
        EXPECT_EQ(detection.all_resonances[i].first, constants[i].name);
        EXPECT_DOUBLE_EQ(detection.all_resonances[i].second, detector.testScaling(loop, constants[i].value));
    }
}

TEST(ResonanceDetectorTest, NegativeToleranceNeverNatural) {
    const resonance::ResonanceDetector detector;
    const auto detection = detector.detect(test::squareLoop(), -1.0);
    EXPECT_GT(detection.best_error, 0.0);
    EXPECT_FALSE(detection.is_natural);
}

TEST(ResonanceDetectorTest, TiesResolveToFirstConstant) {
    resonance::ResonanceDetector::Params params;
    params.constants = {{"first", 0.5}, {"second", 0.5}};
    const resonance::ResonanceDetector detector(params);
    EXPECT_EQ(detector.detect(test::squareLoop()).best_resonance, "first");
    EXPECT_EQ(detector.nearest(0.5).name, "first");
}

TEST(ResonanceDetectorTest, NearestConstant) {
    const resonance::ResonanceDetector detector;

    const auto golden = detector.nearest(0.62);
    EXPECT_EQ(golden.name, "golden_ratio");
    EXPECT_NEAR(golden.distance, 0.62 - resonance::GOLDEN_RATIO, 1e-12);

    EXPECT_EQ(detector.nearest(1.45).name, "perfect_fifth");
    EXPECT_EQ(detector.nearest(1.3).name, "plastic_number");
    EXPECT_EQ(detector.nearest(9.0).name, "silver_ratio");
    EXPECT_EQ(detector.nearest(1.9).name, "octave");
}

TEST(ResonanceDetectorTest, RequiresConstants) {
    resonance::ResonanceDetector::Params params;
    params.constants.clear();
    EXPECT_THROW(resonance::ResonanceDetector{params}, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// ResonanceAwareOptimizer
// -----------------------------------------------------------------------------

TEST(ResonanceAwareOptimizerTest, WindowSearchStaysInWindow) {
    const resonance::ResonanceAwareOptimizer optimizer;
    const auto results = optimizer.multiResonanceSearch(test::squareLoop());
    const auto constants = resonance::standardConstants();
    ASSERT_EQ(results.size(), constants.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].first, constants[i].name);
        EXPECT_GE(results[i].second.first, 0.7 * constants[i].value - 1e-12);
        EXPECT_LE(results[i].second.first, 1.4 * constants[i].value + 1e-12);
        EXPECT_GE(results[i].second.second, 0.0);
    }
}

TEST(ResonanceAwareOptimizerTest, BiasedSearchNeverWorseThanGoldenWindow) {
    const resonance::ResonanceAwareOptimizer optimizer;
    const solver::BoundedScalarSolver solver;
    for (const auto& trajectory : sampleTrajectories()) {
        const auto biased = optimizer.optimizeWithBias(trajectory, true);
        const auto window = solver.optimize(trajectory, {0.7 * resonance::GOLDEN_RATIO, 1.4 * resonance::GOLDEN_RATIO});
        EXPECT_LE(biased.second, window.epsilon);
    }
}

TEST(ResonanceAwareOptimizerTest, UnbiasedSearchUsesWideInterval) {
    const resonance::ResonanceAwareOptimizer optimizer;
    const auto unbiased = optimizer.optimizeWithBias(test::squareLoop(), false);
    const auto reference = solver::BoundedScalarSolver().optimize(test::squareLoop(), {0.1, 10.0});
    EXPECT_DOUBLE_EQ(unbiased.first, reference.lambda);
    EXPECT_DOUBLE_EQ(unbiased.second, reference.epsilon);
}
