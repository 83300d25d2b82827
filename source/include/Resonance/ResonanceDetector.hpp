#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Solver/BoundedScalarSolver.hpp"
#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace resonance {

        // -----------------------------------------------------------------------------
        // Named scale constants
        // -----------------------------------------------------------------------------

        constexpr double GOLDEN_RATIO   = 0.6180339887498949;   ///< (sqrt(5) - 1) / 2
        constexpr double SILVER_RATIO   = 2.414213562373095;    ///< 1 + sqrt(2)
        constexpr double PLASTIC_NUMBER = 1.324717957244;       ///< real root of x^3 = x + 1
        constexpr double OCTAVE         = 2.0;
        constexpr double PERFECT_FIFTH  = 3.0 / 2.0;
        constexpr double PERFECT_FOURTH = 4.0 / 3.0;
        constexpr double MAJOR_THIRD    = 5.0 / 4.0;

        struct ResonanceConstant {
            std::string name;
            double value;
        };

        /** @brief The seven named constants, in comparison order. Ties resolve to the earlier entry. */
        std::vector<ResonanceConstant> standardConstants();

        // -----------------------------------------------------------------------------
        /**
         * @class ResonanceDetector
         * @brief Compares the return error at named constants with the optimized return error.
         *
         * A trajectory "resonates" with a constant when the best constant's error is within
         * a relative tolerance of the error found by a wide bounded search. The comparison
         * only reports values; it makes no claim about why a constant scores well.
         */
        class ResonanceDetector {
            public:
                struct Params {
                    /// @brief Relative slack: natural iff best <= optimal * (1 + tolerance).
                    double tolerance = 0.1;

                    /// @brief Interval of the reference search.
                    solver::Bounds search_bounds{0.1, 10.0};

                    /// @brief Parameters of the reference search.
                    solver::BoundedScalarSolver::Params solver;

                    /// @brief Constants to test, in tie-break order.
                    std::vector<ResonanceConstant> constants = standardConstants();
                };

                // -----------------------------------------------------------------------------
                struct Detection {
                    std::string best_resonance;
                    double best_error = 0.0;
                    std::vector<std::pair<std::string, double>> all_resonances;  ///< name -> error, in constant order
                    bool is_natural = false;
                    double optimal_lambda = 0.0;    ///< Reference search minimizer.
                    double optimal_error = 0.0;     ///< Reference search minimum.
                };

                // -----------------------------------------------------------------------------
                struct Nearest {
                    std::string name;
                    double value = 0.0;
                    double distance = 0.0;
                };

                // -----------------------------------------------------------------------------
                ResonanceDetector();
                explicit ResonanceDetector(const Params& params);

                // -----------------------------------------------------------------------------
                /** @brief Doubled return error at a given scale. */
                double testScaling(const traj::Trajectory& trajectory, double lambda) const;

                // -----------------------------------------------------------------------------
                /** @brief Detection with the configured tolerance. */
                Detection detect(const traj::Trajectory& trajectory) const;

                /** @brief Detection with an explicit tolerance. */
                Detection detect(const traj::Trajectory& trajectory, double tolerance) const;

                // -----------------------------------------------------------------------------
                /** @brief Constant closest to lambda (absolute difference). Pure lookup. */
                Nearest nearest(double lambda) const;

                const Params& params() const noexcept { return params_; }

            private:
                const Params params_;
        };

    }  // namespace resonance
}  // namespace regen
