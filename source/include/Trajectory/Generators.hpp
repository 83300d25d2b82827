#pragma once

#include <cstdint>
#include <random>
#include <utility>

#include <Eigen/Core>

#include "Common/Result.hpp"
#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace traj {

        // -----------------------------------------------------------------------------
        /**
         * @brief Random trajectory of small motions.
         *
         * Rotation vectors are drawn from N(0, rotation_scale^2) per axis and translations
         * from N(0, (r_max / T)^2) per axis. The result goes through Trajectory::Create, so
         * a bounded trajectory whose draws exceed r_max fails with BoundsViolation and
         * T == 0 fails with EmptyTrajectory. A non-positive r_max fails with BoundsViolation,
         * a negative or non-finite rotation_scale with InvalidScale. rotation_scale == 0
         * gives pure translations.
         */
        Result<Trajectory> generateRandomTrajectory(std::size_t T,
                                                    double r_max,
                                                    double rotation_scale,
                                                    bool bounded,
                                                    std::uint64_t seed);

        // -----------------------------------------------------------------------------
        /**
         * @class TetheredWalker
         * @brief Random walk in SE(3) pulled back toward a home pose by an elastic force.
         *
         * Per step of length dt:
         *   t <- t + dt * (-k (t - t_home)) + sqrt(dt) * N(0, translation_noise^2)
         *   v <- v + dt * (-k log(C_home^T C)) + sqrt(dt) * N(0, rotation_noise^2)
         *
         * A zero noise deviation makes that part of the walk deterministic.
         */
        class TetheredWalker {
            public:
                struct Params {
                    double elastic_constant = 0.1;
                    double translation_noise = 0.05;
                    double rotation_noise = 0.1;
                    std::uint64_t seed = 0;
                };

                // -----------------------------------------------------------------------------
                TetheredWalker();

                /** @throws std::invalid_argument for a negative or non-finite noise deviation. */
                explicit TetheredWalker(const Params& params, const Pose& home = Pose());

                // -----------------------------------------------------------------------------
                /** @brief Elastic (translation, rotation) force at the current pose. */
                std::pair<Eigen::Vector3d, Eigen::Vector3d> returnForce() const;

                /** @brief Advances the walk by dt and returns the new pose. */
                const Pose& step(double dt = 0.1);

                const Pose& current() const noexcept { return current_; }
                const Pose& home() const noexcept { return home_; }

            private:
                const Params params_;
                const Pose home_;
                Pose current_;
                std::mt19937_64 engine_;
        };

    }  // namespace traj
}  // namespace regen
