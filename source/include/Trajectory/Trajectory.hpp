#pragma once

#include <cstddef>
#include <vector>

#include "Common/Result.hpp"
#include "LGMath/se3/Pose.hpp"

namespace regen {
    namespace traj {

        using Pose = liemath::se3::Pose;

        // -----------------------------------------------------------------------------
        /**
         * @class Trajectory
         * @brief Ordered, non-empty sequence of SE(3) poses with an optional translation bound.
         *
         * SE(3) is not compact, so a trajectory may carry a radius `r_max`. When `bounded`
         * is set, `Create` rejects any pose with ||r|| > r_max.
         *
         * Trajectories derived by scaling, doubling or perturbation keep `bounded` and
         * `r_max` but are built through `Unvalidated`: the optimizer probes scales above 1
         * that may legitimately push translations past the bound.
         */
        class Trajectory {
            public:

                // -----------------------------------------------------------------------------
                /**
                 * @brief Validating factory.
                 *
                 * Fails with ErrorKind::EmptyTrajectory for an empty sequence, and with
                 * ErrorKind::BoundsViolation for a non-positive r_max or, when bounded, any
                 * translation with norm above r_max.
                 */
                static Result<Trajectory> Create(std::vector<Pose> poses, bool bounded = true, double r_max = 1.0);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Builds a trajectory without checking the bound invariant.
                 *
                 * Used for derived trajectories (scaled, doubled, noisy). Callers are
                 * responsible for `poses` being non-empty.
                 */
                static Trajectory Unvalidated(std::vector<Pose> poses, bool bounded, double r_max);

                // -----------------------------------------------------------------------------
                const std::vector<Pose>& poses() const noexcept { return poses_; }
                std::size_t size() const noexcept { return poses_.size(); }
                const Pose& operator[](std::size_t idx) const { return poses_[idx]; }
                const Pose& at(std::size_t idx) const { return poses_.at(idx); }

                bool bounded() const noexcept { return bounded_; }
                double rMax() const noexcept { return r_max_; }

                // -----------------------------------------------------------------------------
                /** @brief True if unbounded, or every translation norm is within r_max. */
                bool withinBounds() const noexcept;

            private:
                Trajectory(std::vector<Pose> poses, bool bounded, double r_max);

                std::vector<Pose> poses_;
                bool bounded_;
                double r_max_;
        };

        // -----------------------------------------------------------------------------
        // Trajectory operations
        // -----------------------------------------------------------------------------

        /** @brief Left fold of compose from the identity: G = g1 * g2 * ... * gT. */
        Pose composeTrajectory(const Trajectory& trajectory) noexcept;

        /**
         * @brief Scales every pose independently.
         *
         * Keeps `bounded` / `r_max` and does not re-check the bound on the scaled
         * translations. Fails with ErrorKind::InvalidScale for a non-finite lambda.
         */
        Result<Trajectory> scaleTrajectory(const Trajectory& trajectory, double lambda);

        /** @brief The pose sequence concatenated with itself. */
        Trajectory doubleTrajectory(const Trajectory& trajectory);

    }  // namespace traj
}  // namespace regen
