#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Resonance/ResonanceDetector.hpp"
#include "Solver/BoundedScalarSolver.hpp"
#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace resonance {

        // -----------------------------------------------------------------------------
        /**
         * @class ResonanceAwareOptimizer
         * @brief Bounded return-scale search restricted to windows around named constants.
         *
         * Each constant c is searched over [0.7 c, 1.4 c].
         */
        class ResonanceAwareOptimizer {
            public:
                struct Params {
                    /// @brief Strength of the pull toward the golden ratio. Reported only.
                    double bias_strength = 0.5;

                    /// @brief Window around a constant, as multiples of its value.
                    double window_lower = 0.7;
                    double window_upper = 1.4;

                    /// @brief Fallback interval used when the biased window does poorly.
                    solver::Bounds fallback_bounds{0.1, 10.0};

                    /// @brief Biased errors above this trigger the fallback search.
                    double fallback_threshold = 1.0;

                    solver::BoundedScalarSolver::Params solver;

                    std::vector<ResonanceConstant> constants = standardConstants();
                };

                /** @brief (lambda, epsilon) */
                using Estimate = std::pair<double, double>;

                // -----------------------------------------------------------------------------
                ResonanceAwareOptimizer();
                explicit ResonanceAwareOptimizer(const Params& params);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Searches the golden-ratio window, or the fallback interval if unbiased.
                 *
                 * When biased and the window minimum exceeds `fallback_threshold`, the
                 * fallback interval is searched too and the lower error wins.
                 */
                Estimate optimizeWithBias(const traj::Trajectory& trajectory, bool bias_to_golden = true) const;

                // -----------------------------------------------------------------------------
                /** @brief One windowed search per constant, in constant order. */
                std::vector<std::pair<std::string, Estimate>> multiResonanceSearch(const traj::Trajectory& trajectory) const;

                const Params& params() const noexcept { return params_; }

            private:
                solver::Bounds windowAround(double value) const;

                const Params params_;
        };

    }  // namespace resonance
}  // namespace regen
