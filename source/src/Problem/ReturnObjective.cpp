#include "Problem/ReturnObjective.hpp"

namespace regen {
    namespace problem {

        // -----------------------------------------------------------------------------
        // returnPose
        // -----------------------------------------------------------------------------

        traj::Pose returnPose(const traj::Trajectory& trajectory, double lambda, bool doubled) {
            const traj::Trajectory scaled = traj::scaleTrajectory(trajectory, lambda).value();
            if (doubled) {
                return traj::composeTrajectory(traj::doubleTrajectory(scaled));
            }
            return traj::composeTrajectory(scaled);
        }

        // -----------------------------------------------------------------------------
        // returnError
        // -----------------------------------------------------------------------------

        double returnError(const traj::Trajectory& trajectory, double lambda, bool doubled) {
            return liemath::se3::distanceToIdentity(returnPose(trajectory, lambda, doubled));
        }

        // -----------------------------------------------------------------------------
        // verifyApproximateReturn
        // -----------------------------------------------------------------------------

        ReturnQuality verifyApproximateReturn(const traj::Trajectory& trajectory,
                                              double lambda,
                                              double tolerance,
                                              bool doubled) {
            const traj::Pose final_pose = returnPose(trajectory, lambda, doubled);

            ReturnQuality quality;
            quality.rotation_error = liemath::se3::rotationError(final_pose);
            quality.translation_error = liemath::se3::translationError(final_pose);
            quality.total_error = liemath::se3::distanceToIdentity(final_pose);
            quality.return_achieved = quality.total_error < tolerance;
            quality.tolerance = tolerance;
            quality.lambda = lambda;
            return quality;
        }

    }  // namespace problem
}  // namespace regen
