#pragma once

#include <cstdint>
#include <iostream>
#include <optional>

#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace verification {

        // -----------------------------------------------------------------------------
        /**
         * @brief One value per verification level.
         *
         * Used for raw metrics, normalized scores, weights and thresholds alike.
         */
        struct LevelValues {
            double topological = 0.0;
            double energetic = 0.0;
            double temporal = 0.0;
            double spatial = 0.0;
            double stochastic = 0.0;
        };

        // -----------------------------------------------------------------------------
        struct VerificationResult {
            LevelValues raw;            ///< Per-level metric as measured.
            LevelValues normalized;     ///< Per-level score in [0, 1], 1 is best.
            double overall_score = 0.0; ///< Weighted sum of normalized scores.
            bool passed = false;
            double reward = 0.0;        ///< overall_score * base_unit
        };

        // -----------------------------------------------------------------------------
        /**
         * @class VerificationCascade
         * @brief Five independent quality checks of a return scale, combined into one score.
         *
         * Levels:
         *  - topological: return error at lambda (lower is better)
         *  - energetic:   mean ||log R|| + ||t|| over the doubled, scaled trajectory
         *  - temporal:    coefficient of variation of step sizes in the unscaled trajectory
         *  - spatial:     1 if every translation is within r_max (or unbounded), else 0
         *  - stochastic:  robustness of the return error to Gaussian pose noise
         *
         * The configuration is fixed at construction.
         */
        class VerificationCascade {
            public:
                struct Params {
                    /// @brief Enable verbose logging of the level values.
                    bool verbose = false;

                    /// @brief Destination of verbose output.
                    std::ostream* log_stream = &std::cout;

                    LevelValues weights{0.3, 0.2, 0.2, 0.2, 0.1};

                    /// @brief Pass limits. Upper limits except stochastic, which is a lower limit.
                    LevelValues thresholds{0.1, 0.05, 0.1, 1.0, 0.8};

                    /// @brief normalized = max(0, 1 - raw / divisor)
                    double topological_divisor = 2.0;
                    double energetic_divisor = 0.5;
                    double temporal_divisor = 1.0;

                    /// @brief Robustness reported when the baseline error is ~0.
                    double zero_baseline_robustness = 0.5;

                    /// @brief Number of noisy copies. Must be positive.
                    unsigned int noise_trials = 10;

                    /// @brief Per-component noise deviation. 0 leaves the poses unperturbed.
                    double noise_std = 0.05;

                    /// @brief Noise seed. Unset draws a fresh seed per evaluation.
                    std::optional<std::uint64_t> seed;
                };

                // -----------------------------------------------------------------------------
                VerificationCascade();

                /** @throws std::invalid_argument for a negative or non-finite noise_std, or zero noise_trials. */
                explicit VerificationCascade(const Params& params);

                // -----------------------------------------------------------------------------
                double returnQuality(const traj::Trajectory& trajectory, double lambda) const;
                double energyImbalance(const traj::Trajectory& trajectory, double lambda) const;
                double timingVariation(const traj::Trajectory& trajectory) const;
                double boundedDomain(const traj::Trajectory& trajectory) const;

                // -----------------------------------------------------------------------------
                /**
                 * @brief Robustness of the return error to noise, in [0, 1].
                 *
                 * Each trial perturbs every rotation vector and translation with N(0, noise_std^2)
                 * and recomputes the return error. Trials run in parallel; trial i draws from
                 * an engine seeded by (seed, i), so a fixed seed gives a fixed result.
                 *
                 *   robustness = clamp(1 - (mean_noisy - baseline) / baseline, 0, 1)
                 *
                 * A baseline below 1e-10 yields zero_baseline_robustness.
                 */
                double noiseRobustness(const traj::Trajectory& trajectory, double lambda) const;

                // -----------------------------------------------------------------------------
                /** @brief Runs all five levels and combines them. */
                VerificationResult verify(const traj::Trajectory& trajectory,
                                          double lambda,
                                          double base_unit = 100.0) const;

                const Params& params() const noexcept { return params_; }

            private:
                const Params params_;
        };

        std::ostream& operator<<(std::ostream& out, const LevelValues& values);

    }  // namespace verification
}  // namespace regen
