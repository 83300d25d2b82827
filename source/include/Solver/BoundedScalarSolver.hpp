#pragma once

#include <functional>
#include <iostream>

#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace solver {

        // -----------------------------------------------------------------------------
        /** @brief Closed search interval [lower, upper] for the scale factor. */
        struct Bounds {
            double lower = 0.1;
            double upper = 2.0;
        };

        // -----------------------------------------------------------------------------
        /**
         * @class BoundedScalarSolver
         * @brief Derivative-free minimizer of a scalar function over a closed interval.
         *
         * Brent's method: golden-section steps with parabolic interpolation when the
         * three best points allow an acceptable parabola. The search is deterministic;
         * the same objective and bounds always produce the same sequence of evaluations.
         *
         * Running out of evaluations is not an error: the best point found is returned
         * with `converged == false`.
         */
        class BoundedScalarSolver {
            public:
                struct Params {
                    /// @brief Enable verbose logging of the search.
                    bool verbose = false;

                    /// @brief Destination of verbose output.
                    std::ostream* log_stream = &std::cout;

                    /// @brief Maximum number of objective evaluations.
                    unsigned int max_evaluations = 500;

                    /// @brief Absolute tolerance on the abscissa.
                    double xatol = 1e-5;
                };

                // -----------------------------------------------------------------------------
                enum Termination {
                    TERMINATE_NOT_YET_TERMINATED,   ///< Search still running.
                    TERMINATE_CONVERGED_BRACKET,    ///< Bracket shrank below tolerance.
                    TERMINATE_MAX_EVALUATIONS,      ///< Evaluation budget exhausted.
                    TERMINATE_NAN_ENCOUNTERED       ///< Objective or abscissa became NaN.
                };

                // -----------------------------------------------------------------------------
                /** @brief Outcome of a minimization. */
                struct Result {
                    double lambda = 0.0;            ///< Minimizing abscissa.
                    double epsilon = 0.0;           ///< Objective value at lambda.
                    bool converged = false;
                    unsigned int evaluations = 0;
                    Termination termination = TERMINATE_NOT_YET_TERMINATED;
                };

                using Objective = std::function<double(double)>;

                // -----------------------------------------------------------------------------
                BoundedScalarSolver();
                explicit BoundedScalarSolver(const Params& params);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Minimizes `objective` over [bounds.lower, bounds.upper].
                 *
                 * Throws regen::Error (ErrorKind::InvalidScale) if the bounds are not finite
                 * or lower > upper.
                 */
                Result minimize(const Objective& objective, const Bounds& bounds) const;

                // -----------------------------------------------------------------------------
                /**
                 * @brief Finds the scale factor minimizing the return error of a trajectory.
                 *
                 * @param trajectory Trajectory to analyze.
                 * @param bounds     Search interval for lambda.
                 * @param doubled    Whether the scaled trajectory is traversed twice.
                 */
                Result optimize(const traj::Trajectory& trajectory,
                                const Bounds& bounds = Bounds(),
                                bool doubled = true) const;

                const Params& params() const noexcept { return params_; }

            private:
                const Params params_;
        };

        using ReturnResult = BoundedScalarSolver::Result;

        // -----------------------------------------------------------------------------
        std::ostream& operator<<(std::ostream& out, const BoundedScalarSolver::Termination& T);

    }  // namespace solver
}  // namespace regen
