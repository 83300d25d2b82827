#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "LGMath/so3/Operations.hpp"
#include "Trajectory/Generators.hpp"

namespace regen {
    namespace traj {

        namespace {

            // N(0, stddev^2) per axis. A zero deviation draws nothing.
            Eigen::Vector3d gaussianVector(double stddev, std::mt19937_64& engine) {
                if (stddev == 0.0) return Eigen::Vector3d::Zero();
                std::normal_distribution<double> dist(0.0, stddev);
                Eigen::Vector3d v;
                for (int k = 0; k < 3; ++k) v[k] = dist(engine);
                return v;
            }

            bool isDeviation(double stddev) {
                return std::isfinite(stddev) && stddev >= 0.0;
            }

        }  // namespace

        // -----------------------------------------------------------------------------
        // generateRandomTrajectory
        // -----------------------------------------------------------------------------

        Result<Trajectory> generateRandomTrajectory(std::size_t T,
                                                    double r_max,
                                                    double rotation_scale,
                                                    bool bounded,
                                                    std::uint64_t seed) {
            if (T == 0) {
                return Error(ErrorKind::EmptyTrajectory, "[generateRandomTrajectory] T must be positive.");
            }

            if (!std::isfinite(r_max) || r_max <= 0.0) {
                return Error(ErrorKind::BoundsViolation, "[generateRandomTrajectory] r_max must be a positive finite value.");
            }
            if (!isDeviation(rotation_scale)) {
                return Error(ErrorKind::InvalidScale, "[generateRandomTrajectory] rotation_scale must be finite and non-negative.");
            }

            std::mt19937_64 engine(seed);
            const double translation_std = r_max / static_cast<double>(T);

            std::vector<Pose> poses;
            poses.reserve(T);
            for (std::size_t i = 0; i < T; ++i) {
                const Eigen::Vector3d aaxis = gaussianVector(rotation_scale, engine);
                const Eigen::Vector3d r = gaussianVector(translation_std, engine);
                auto pose = Pose::FromRotationVector(aaxis, r);
                if (!pose) return pose.error();
                poses.push_back(std::move(pose).value());
            }
            return Trajectory::Create(std::move(poses), bounded, r_max);
        }

        // -----------------------------------------------------------------------------
        // TetheredWalker
        // -----------------------------------------------------------------------------

        TetheredWalker::TetheredWalker() : TetheredWalker(Params()) {}

        TetheredWalker::TetheredWalker(const Params& params, const Pose& home)
            : params_(params), home_(home), current_(), engine_(params.seed) {
            if (!isDeviation(params_.translation_noise) || !isDeviation(params_.rotation_noise)) {
                throw std::invalid_argument("[TetheredWalker::TetheredWalker] Noise deviations must be finite and non-negative.");
            }
        }

        // -----------------------------------------------------------------------------
        // returnForce
        // -----------------------------------------------------------------------------

        std::pair<Eigen::Vector3d, Eigen::Vector3d> TetheredWalker::returnForce() const {
            const Eigen::Vector3d translation_force =
                -params_.elastic_constant * (current_.translation() - home_.translation());
            const Eigen::Matrix3d relative = home_.rotation().transpose() * current_.rotation();
            const Eigen::Vector3d rotation_force = -params_.elastic_constant * liemath::so3::rot2vec(relative);
            return {translation_force, rotation_force};
        }

        // -----------------------------------------------------------------------------
        // step
        // -----------------------------------------------------------------------------

        const Pose& TetheredWalker::step(double dt) {
            const auto force = returnForce();

            const Eigen::Vector3d dt_noise = gaussianVector(params_.translation_noise, engine_);
            const Eigen::Vector3d dr_noise = gaussianVector(params_.rotation_noise, engine_);

            const double sqrt_dt = std::sqrt(dt);
            const Eigen::Vector3d r = current_.translation() + dt * force.first + sqrt_dt * dt_noise;
            const Eigen::Vector3d aaxis = current_.vec() + dt * force.second + sqrt_dt * dr_noise;

            current_ = Pose::FromRotationVector(aaxis, r).value();
            return current_;
        }

    }  // namespace traj
}  // namespace regen
