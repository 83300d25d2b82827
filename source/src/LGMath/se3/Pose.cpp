#include <cmath>
#include <sstream>

#include "LGMath/se3/Pose.hpp"
#include "LGMath/so3/Operations.hpp"

namespace regen {
    namespace liemath {
        namespace se3 {

            // ----------------------------------------------------------------------------
            // Default constructor (Identity pose)
            // ----------------------------------------------------------------------------

            Pose::Pose()
                : C_(Eigen::Matrix3d::Identity()), r_(Eigen::Vector3d::Zero()) {}

            // ----------------------------------------------------------------------------
            // Unvalidated constructor
            // ----------------------------------------------------------------------------

            Pose::Pose(const Eigen::Matrix3d& C, const Eigen::Vector3d& r)
                : C_(C), r_(r) {}

            // ----------------------------------------------------------------------------
            // Create
            // ----------------------------------------------------------------------------

            Result<Pose> Pose::Create(const Eigen::Ref<const Eigen::Matrix3d>& C,
                                      const Eigen::Ref<const Eigen::Vector3d>& r,
                                      double tol) {
                if (!r.allFinite()) {
                    return Error(ErrorKind::InvalidPose, "[Pose::Create] Translation contains non-finite values.");
                }
                if (!so3::isRotation(C, tol)) {
                    std::ostringstream ss;
                    ss << "[Pose::Create] Rotation is not a proper orthogonal matrix (det = "
                       << C.determinant() << ").";
                    return Error(ErrorKind::InvalidPose, ss.str());
                }
                return Pose(C, r);
            }

            // ----------------------------------------------------------------------------
            // FromRotationVector
            // ----------------------------------------------------------------------------

            Result<Pose> Pose::FromRotationVector(const Eigen::Ref<const Eigen::Vector3d>& aaxis,
                                                  const Eigen::Ref<const Eigen::Vector3d>& r) {
                if (!aaxis.allFinite() || !r.allFinite()) {
                    return Error(ErrorKind::InvalidPose, "[Pose::FromRotationVector] Input contains non-finite values.");
                }
                return Pose(so3::vec2rot(aaxis), r);
            }

            // ----------------------------------------------------------------------------
            // FromQuaternion
            // ----------------------------------------------------------------------------

            Result<Pose> Pose::FromQuaternion(const Eigen::Quaterniond& q,
                                              const Eigen::Ref<const Eigen::Vector3d>& r) {
                if (!q.coeffs().allFinite() || q.norm() < 1e-12 || !r.allFinite()) {
                    return Error(ErrorKind::InvalidPose, "[Pose::FromQuaternion] Quaternion is degenerate or input is non-finite.");
                }
                return Pose(so3::quat2rot(q), r);
            }

            // ----------------------------------------------------------------------------
            // Conversions
            // ----------------------------------------------------------------------------

            Eigen::Vector3d Pose::vec() const noexcept {
                return so3::rot2vec(C_);
            }

            Eigen::Quaterniond Pose::quaternion() const noexcept {
                return so3::rot2quat(C_);
            }

            Eigen::Matrix4d Pose::matrix() const noexcept {
                Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
                T.topLeftCorner<3, 3>() = C_;
                T.topRightCorner<3, 1>() = r_;
                return T;
            }

            // ----------------------------------------------------------------------------
            // Inverse
            // ----------------------------------------------------------------------------

            Pose Pose::inverse() const noexcept {
                const Eigen::Matrix3d C_inv = C_.transpose();
                return Pose(C_inv, -C_inv * r_);
            }

            // ----------------------------------------------------------------------------
            // Ensures the rotation remains within SO(3)
            // ----------------------------------------------------------------------------

            void Pose::reproject() noexcept {
                if (std::abs(1.0 - C_.determinant()) > 1e-6) {
                    C_ = so3::vec2rot(so3::rot2vec(C_));
                }
            }

            // ----------------------------------------------------------------------------
            // Composition
            // ----------------------------------------------------------------------------

            Pose Pose::operator*(const Pose& T_rhs) const noexcept {
                Pose result(C_ * T_rhs.C_, C_ * T_rhs.r_ + r_);
                result.reproject();
                return result;
            }

            // ----------------------------------------------------------------------------
            // isApprox
            // ----------------------------------------------------------------------------

            bool Pose::isApprox(const Pose& other, double tol) const noexcept {
                return (C_ - other.C_).cwiseAbs().maxCoeff() <= tol &&
                       (r_ - other.r_).cwiseAbs().maxCoeff() <= tol;
            }

            // ----------------------------------------------------------------------------
            // Group operations
            // ----------------------------------------------------------------------------

            Pose identity() noexcept {
                return Pose();
            }

            Pose compose(const Pose& a, const Pose& b) noexcept {
                return a * b;
            }

            Result<Pose> scale(const Pose& pose, double lambda) {
                if (!std::isfinite(lambda)) {
                    return Error(ErrorKind::InvalidScale, "[se3::scale] Scale factor must be finite.");
                }
                return Pose::FromRotationVector(lambda * pose.vec(), lambda * pose.translation());
            }

            // ----------------------------------------------------------------------------
            // Distances
            // ----------------------------------------------------------------------------

            double rotationError(const Pose& pose) noexcept {
                return so3::distanceToIdentity(pose.rotation());
            }

            double translationError(const Pose& pose) noexcept {
                return pose.translation().norm();
            }

            double distanceToIdentity(const Pose& pose) noexcept {
                return rotationError(pose) + translationError(pose);
            }

            // ----------------------------------------------------------------------------
            // Adjoint
            // ----------------------------------------------------------------------------

            Eigen::Matrix4d adjoint(const Pose& g, const Eigen::Matrix4d& X) noexcept {
                const Eigen::Matrix3d& C = g.rotation();
                Eigen::Matrix4d result = Eigen::Matrix4d::Zero();
                result.topLeftCorner<3, 3>() = C * X.topLeftCorner<3, 3>() * C.transpose();
                result.topRightCorner<3, 1>() = C * X.topRightCorner<3, 1>();
                return result;
            }

            double interventionInterference(const Pose& a, const Pose& b) noexcept {
                const Eigen::Matrix4d T_b = b.matrix();
                return (adjoint(a, T_b) - T_b).norm();
            }

        }  // namespace se3
    }  // namespace liemath
}  // namespace regen

// -----------------------------------------------------------------------------
// Print pose
// -----------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& out, const regen::liemath::se3::Pose& T) {
    out << "\n" << T.matrix() << "\n";
    return out;
}
