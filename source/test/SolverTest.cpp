#include <cmath>
#include <limits>
#include <sstream>

#include <gtest/gtest.h>

#include "Problem/ReturnObjective.hpp"
#include "Solver/BoundedScalarSolver.hpp"
#include "TestTrajectories.hpp"

using namespace regen;

// -----------------------------------------------------------------------------
// Return objective
// -----------------------------------------------------------------------------

TEST(ReturnObjectiveTest, SelfCancellingTrajectoryReturns) {
    const traj::Trajectory loop = test::selfCancelling();
    EXPECT_LT(problem::returnError(loop, 1.0, true), 1e-6);
    EXPECT_LT(problem::returnError(loop, 1.0, false), 1e-6);

    const auto quality = problem::verifyApproximateReturn(loop, 1.0);
    EXPECT_TRUE(quality.return_achieved);
    EXPECT_LT(quality.total_error, 1e-6);
    EXPECT_DOUBLE_EQ(quality.lambda, 1.0);
    EXPECT_DOUBLE_EQ(quality.tolerance, 0.1);
}

TEST(ReturnObjectiveTest, ErrorIsPipelineComposition) {
    const traj::Trajectory loop = test::squareLoop();
    const double lambda = 0.8;
    const traj::Trajectory scaled = traj::scaleTrajectory(loop, lambda).value();
    const traj::Pose expected = traj::composeTrajectory(traj::doubleTrajectory(scaled));
    EXPECT_DOUBLE_EQ(problem::returnError(loop, lambda, true), liemath::se3::distanceToIdentity(expected));
    EXPECT_DOUBLE_EQ(problem::returnError(loop, lambda, false),
                     liemath::se3::distanceToIdentity(traj::composeTrajectory(scaled)));
}

TEST(ReturnObjectiveTest, QualityBreakdown) {
    const traj::Trajectory loop = test::squareLoop();
    const auto quality = problem::verifyApproximateReturn(loop, 1.3, 1e-9);
    EXPECT_NEAR(quality.total_error, quality.rotation_error + quality.translation_error, 1e-12);
    EXPECT_FALSE(quality.return_achieved);
}

TEST(ReturnObjectiveTest, ZeroScaleReturnsExactly) {
    EXPECT_NEAR(problem::returnError(test::squareLoop(), 0.0), 0.0, 1e-12);
}

TEST(ReturnObjectiveTest, NonFiniteScaleThrows) {
    EXPECT_THROW(problem::returnError(test::squareLoop(), std::numeric_limits<double>::infinity()), Error);
}

// -----------------------------------------------------------------------------
// Bounded scalar solver
// -----------------------------------------------------------------------------

TEST(BoundedScalarSolverTest, FindsMinimumOfParabola) {
    const solver::BoundedScalarSolver solver;
    const auto result = solver.minimize([](double x) { return (x - 0.7) * (x - 0.7) + 0.25; }, {0.1, 2.0});
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.termination, solver::BoundedScalarSolver::TERMINATE_CONVERGED_BRACKET);
    EXPECT_NEAR(result.lambda, 0.7, 1e-4);
    EXPECT_NEAR(result.epsilon, 0.25, 1e-8);
    EXPECT_GT(result.evaluations, 1u);
    EXPECT_LT(result.evaluations, 500u);
}

TEST(BoundedScalarSolverTest, MinimumAtBoundary) {
    const solver::BoundedScalarSolver solver;
    const auto result = solver.minimize([](double x) { return x; }, {0.5, 1.5});
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.lambda, 0.5, 1e-4);
}

TEST(BoundedScalarSolverTest, EvaluationBudgetIsReportedNotThrown) {
    solver::BoundedScalarSolver::Params params;
    params.max_evaluations = 3;
    const solver::BoundedScalarSolver solver(params);
    const auto result = solver.minimize([](double x) { return std::cos(3.0 * x); }, {0.1, 2.0});
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.termination, solver::BoundedScalarSolver::TERMINATE_MAX_EVALUATIONS);
    EXPECT_EQ(result.evaluations, 3u);
}

TEST(BoundedScalarSolverTest, InvalidBoundsThrow) {
    const solver::BoundedScalarSolver solver;
    const auto f = [](double x) { return x * x; };
    try {
        solver.minimize(f, {2.0, 1.0});
        FAIL() << "expected regen::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidScale);
    }
    EXPECT_THROW(solver.minimize(f, {std::numeric_limits<double>::quiet_NaN(), 1.0}), Error);
}

TEST(BoundedScalarSolverTest, OptimizeIsDeterministic) {
    const solver::BoundedScalarSolver solver;
    const traj::Trajectory loop = test::squareLoop();
    const auto first = solver.optimize(loop);
    const auto second = solver.optimize(loop);
    EXPECT_EQ(first.lambda, second.lambda);
    EXPECT_EQ(first.epsilon, second.epsilon);
    EXPECT_EQ(first.evaluations, second.evaluations);

    EXPECT_GE(first.lambda, 0.1);
    EXPECT_LE(first.lambda, 2.0);
    EXPECT_GE(first.epsilon, 0.0);
    EXPECT_DOUBLE_EQ(first.epsilon, problem::returnError(loop, first.lambda, true));
}

TEST(BoundedScalarSolverTest, VerboseOutputGoesToStream) {
    std::ostringstream log;
    solver::BoundedScalarSolver::Params params;
    params.verbose = true;
    params.log_stream = &log;
    const solver::BoundedScalarSolver solver(params);
    solver.optimize(test::squareLoop());
    EXPECT_NE(log.str().find("[BoundedScalarSolver::minimize]"), std::string::npos);
    EXPECT_NE(log.str().find("[BoundedScalarSolver::optimize]"), std::string::npos);
}
