#include <cmath>
#include <sstream>
#include <utility>

#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace traj {

        // -----------------------------------------------------------------------------
        // Constructor
        // -----------------------------------------------------------------------------

        Trajectory::Trajectory(std::vector<Pose> poses, bool bounded, double r_max)
            : poses_(std::move(poses)), bounded_(bounded), r_max_(r_max) {}

        // -----------------------------------------------------------------------------
        // Create
        // -----------------------------------------------------------------------------

        Result<Trajectory> Trajectory::Create(std::vector<Pose> poses, bool bounded, double r_max) {
            if (poses.empty()) {
                return Error(ErrorKind::EmptyTrajectory, "[Trajectory::Create] Trajectory must contain at least one pose.");
            }
            if (!std::isfinite(r_max) || r_max <= 0.0) {
                return Error(ErrorKind::BoundsViolation, "[Trajectory::Create] r_max must be a positive finite value.");
            }
            if (bounded) {
                for (std::size_t i = 0; i < poses.size(); ++i) {
                    const double norm = poses[i].translation().norm();
                    if (norm > r_max) {
                        std::ostringstream ss;
                        ss << "[Trajectory::Create] Translation norm " << norm << " of pose " << i
                           << " exceeds r_max " << r_max << ".";
                        return Error(ErrorKind::BoundsViolation, ss.str());
                    }
                }
            }
            return Trajectory(std::move(poses), bounded, r_max);
        }

        // -----------------------------------------------------------------------------
        // Unvalidated
        // -----------------------------------------------------------------------------

        Trajectory Trajectory::Unvalidated(std::vector<Pose> poses, bool bounded, double r_max) {
            return Trajectory(std::move(poses), bounded, r_max);
        }

        // -----------------------------------------------------------------------------
        // withinBounds
        // -----------------------------------------------------------------------------

        bool Trajectory::withinBounds() const noexcept {
            if (!bounded_) return true;
            for (const auto& pose : poses_) {
                if (pose.translation().norm() > r_max_) return false;
            }
            return true;
        }

        // -----------------------------------------------------------------------------
        // composeTrajectory
        // -----------------------------------------------------------------------------

        Pose composeTrajectory(const Trajectory& trajectory) noexcept {
            Pose result = liemath::se3::identity();
            for (const auto& pose : trajectory.poses()) {
                result = liemath::se3::compose(result, pose);
            }
            return result;
        }

        // -----------------------------------------------------------------------------
        // scaleTrajectory
        // -----------------------------------------------------------------------------

        Result<Trajectory> scaleTrajectory(const Trajectory& trajectory, double lambda) {
            std::vector<Pose> scaled;
            scaled.reserve(trajectory.size());
            for (const auto& pose : trajectory.poses()) {
                auto result = liemath::se3::scale(pose, lambda);
                if (!result) return result.error();
                scaled.push_back(std::move(result).value());
            }
            return Trajectory::Unvalidated(std::move(scaled), trajectory.bounded(), trajectory.rMax());
        }

        // -----------------------------------------------------------------------------
        // doubleTrajectory
        // -----------------------------------------------------------------------------

        Trajectory doubleTrajectory(const Trajectory& trajectory) {
            std::vector<Pose> doubled;
            doubled.reserve(2 * trajectory.size());
            doubled.insert(doubled.end(), trajectory.poses().begin(), trajectory.poses().end());
            doubled.insert(doubled.end(), trajectory.poses().begin(), trajectory.poses().end());
            return Trajectory::Unvalidated(std::move(doubled), trajectory.bounded(), trajectory.rMax());
        }

    }  // namespace traj
}  // namespace regen
