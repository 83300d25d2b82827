#include "LGMath/so3/Operations.hpp"

#include <cmath>

namespace regen {
    namespace liemath {
        namespace so3 {

            // -----------------------------------------------------------------------------
            // SO(3) Hat Operator
            // -----------------------------------------------------------------------------

            Eigen::Matrix3d hat(const Eigen::Ref<const Eigen::Vector3d>& vector) noexcept {
                Eigen::Matrix3d mat = Eigen::Matrix3d::Zero();
                mat(0, 1) = -vector[2];
                mat(0, 2) = vector[1];
                mat(1, 0) = vector[2];
                mat(1, 2) = -vector[0];
                mat(2, 0) = -vector[1];
                mat(2, 1) = vector[0];
                return mat;
            }

            // -----------------------------------------------------------------------------
            // SO(3) Exponential Map (Vector to Rotation)
            // -----------------------------------------------------------------------------

            Eigen::Matrix3d vec2rot(const Eigen::Ref<const Eigen::Vector3d>& aaxis_ba) noexcept {
                const double phi_ba = aaxis_ba.norm();
                if (phi_ba < 1e-12) {
                    return Eigen::Matrix3d::Identity();
                }

                // Rodrigues' formula
                const double sinphi = std::sin(phi_ba);
                const double cosphi = std::cos(phi_ba);
                const Eigen::Vector3d axis = aaxis_ba / phi_ba;
                return cosphi * Eigen::Matrix3d::Identity() +
                    (1.0 - cosphi) * (axis * axis.transpose()) +
                    sinphi * hat(axis);
            }

            // -----------------------------------------------------------------------------
            // SO(3) Logarithmic Map (Rotation to Vector)
            // -----------------------------------------------------------------------------

            Eigen::Vector3d rot2vec(const Eigen::Ref<const Eigen::Matrix3d>& C_ab) noexcept {
                const Eigen::Quaterniond q = rot2quat(C_ab);
                const double vnorm = q.vec().norm();
                const double angle = 2.0 * std::atan2(vnorm, q.w());

                // angle / sin(angle / 2), with its Taylor expansion near zero
                double scale;
                if (angle <= 1e-3) {
                    const double angle2 = angle * angle;
                    scale = 2.0 + angle2 / 12.0 + 7.0 * angle2 * angle2 / 2880.0;
                } else {
                    scale = angle / std::sin(0.5 * angle);
                }
                return scale * q.vec();
            }

            // -----------------------------------------------------------------------------
            // Quaternion conversions
            // -----------------------------------------------------------------------------

            Eigen::Quaterniond rot2quat(const Eigen::Ref<const Eigen::Matrix3d>& C_ab) noexcept {
                const Eigen::Matrix3d C = C_ab;
                Eigen::Quaterniond q(C);
                q.normalize();
                if (q.w() < 0.0) {
                    q.coeffs() = -q.coeffs();
                }
                return q;
            }

            Eigen::Matrix3d quat2rot(const Eigen::Quaterniond& q) noexcept {
                return q.normalized().toRotationMatrix();
            }

            // -----------------------------------------------------------------------------
            // Validation
            // -----------------------------------------------------------------------------

            bool isRotation(const Eigen::Ref<const Eigen::Matrix3d>& C, double tol) noexcept {
                if (!C.allFinite()) return false;
                const double orth_err = (C * C.transpose() - Eigen::Matrix3d::Identity()).cwiseAbs().maxCoeff();
                if (orth_err > tol) return false;
                return std::abs(C.determinant() - 1.0) <= tol;
            }

            // -----------------------------------------------------------------------------
            // Distance to identity
            // -----------------------------------------------------------------------------

            double distanceToIdentity(const Eigen::Ref<const Eigen::Matrix3d>& C) noexcept {
                return (C - Eigen::Matrix3d::Identity()).norm();
            }

        }  // namespace so3
    }  // namespace liemath
}  // namespace regen
