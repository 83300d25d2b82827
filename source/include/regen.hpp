#pragma once

// common
#include "Common/Error.hpp"
#include "Common/Result.hpp"
#include "Common/Timer.hpp"

// lie group math
#include "LGMath/LieGroupMath.hpp"

// trajectory
#include "Trajectory/Trajectory.hpp"
#include "Trajectory/Generators.hpp"

// problem
#include "Problem/ReturnObjective.hpp"

// solver
#include "Solver/BoundedScalarSolver.hpp"

// resonance
#include "Resonance/ResonanceDetector.hpp"
#include "Resonance/ResonanceAwareOptimizer.hpp"

// verification
#include "Verification/VerificationCascade.hpp"

// service
#include "Service/TrajectoryEncoder.hpp"
#include "Service/MetricsService.hpp"
