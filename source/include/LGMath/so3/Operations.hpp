#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace regen {
    namespace liemath {
        namespace so3 {

            // -----------------------------------------------------------------------------
            // SO(3) Hat Operator
            // -----------------------------------------------------------------------------

            /**
             * @brief Constructs a 3x3 skew-symmetric matrix (hat operator) from a 3x1 vector.
             * @param vector 3x1 vector.
             * @return 3x3 skew-symmetric matrix.
             */
            Eigen::Matrix3d hat(const Eigen::Ref<const Eigen::Vector3d>& vector) noexcept;

            // -----------------------------------------------------------------------------
            // SO(3) Exponential Map (Vector to Rotation)
            // -----------------------------------------------------------------------------

            /**
             * @brief Computes a 3x3 rotation matrix from an axis-angle vector using the exponential map.
             * @param aaxis_ba 3x1 axis-angle vector.
             * @return 3x3 rotation matrix.
             */
            Eigen::Matrix3d vec2rot(const Eigen::Ref<const Eigen::Vector3d>& aaxis_ba) noexcept;

            // -----------------------------------------------------------------------------
            // SO(3) Logarithmic Map (Rotation to Vector)
            // -----------------------------------------------------------------------------

            /**
             * @brief Computes the axis-angle vector from a 3x3 rotation matrix using the logarithmic map.
             *
             * Goes through the unit quaternion and an `atan2` angle so that rotations
             * close to pi keep a well-defined axis. The returned angle lies in [0, pi].
             *
             * @param C_ab 3x3 rotation matrix.
             * @return 3x1 axis-angle vector.
             */
            Eigen::Vector3d rot2vec(const Eigen::Ref<const Eigen::Matrix3d>& C_ab) noexcept;

            // -----------------------------------------------------------------------------
            // Quaternion conversions
            // -----------------------------------------------------------------------------

            /**
             * @brief Unit quaternion of a rotation matrix, with non-negative scalar part.
             */
            Eigen::Quaterniond rot2quat(const Eigen::Ref<const Eigen::Matrix3d>& C_ab) noexcept;

            /**
             * @brief Rotation matrix of a (not necessarily normalized) quaternion.
             */
            Eigen::Matrix3d quat2rot(const Eigen::Quaterniond& q) noexcept;

            // -----------------------------------------------------------------------------
            // Validation
            // -----------------------------------------------------------------------------

            /**
             * @brief Checks that C is a proper rotation within a tolerance.
             *
             * Requires finite entries, max |C C^T - I| <= tol and |det(C) - 1| <= tol.
             */
            bool isRotation(const Eigen::Ref<const Eigen::Matrix3d>& C, double tol = 1e-6) noexcept;

            // -----------------------------------------------------------------------------
            /**
             * @brief Frobenius distance of a rotation matrix from the identity, ||C - I||_F.
             */
            double distanceToIdentity(const Eigen::Ref<const Eigen::Matrix3d>& C) noexcept;

        }  // namespace so3
    }  // namespace liemath
}  // namespace regen
