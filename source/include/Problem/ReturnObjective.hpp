#pragma once

#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace problem {

        // -----------------------------------------------------------------------------
        /**
         * @brief Composed pose of the scaled (and optionally doubled) trajectory.
         *
         * G = compose(double ? double(scale(traj, lambda)) : scale(traj, lambda)).
         * Throws regen::Error (ErrorKind::InvalidScale) for a non-finite lambda.
         */
        traj::Pose returnPose(const traj::Trajectory& trajectory, double lambda, bool doubled = true);

        // -----------------------------------------------------------------------------
        /**
         * @brief Return error ||G - I|| = distanceToIdentity(returnPose(...)).
         *
         * This is the objective minimized by the bounded solver and evaluated by the
         * resonance detector and the topological / stochastic verification levels.
         * Throws regen::Error (ErrorKind::InvalidScale) for a non-finite lambda.
         */
        double returnError(const traj::Trajectory& trajectory, double lambda, bool doubled = true);

        // -----------------------------------------------------------------------------
        /**
         * @brief Breakdown of the return error at a given scale.
         */
        struct ReturnQuality {
            double total_error = 0.0;
            double rotation_error = 0.0;
            double translation_error = 0.0;
            bool return_achieved = false;   ///< total_error < tolerance
            double tolerance = 0.1;
            double lambda = 1.0;
        };

        // -----------------------------------------------------------------------------
        /**
         * @brief Evaluates how closely the scaled (doubled) trajectory returns to identity.
         */
        ReturnQuality verifyApproximateReturn(const traj::Trajectory& trajectory,
                                              double lambda,
                                              double tolerance = 0.1,
                                              bool doubled = true);

    }  // namespace problem
}  // namespace regen
