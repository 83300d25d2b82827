#pragma once

#include <iostream>

#include <Eigen/Core>
#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "Common/Result.hpp"

namespace regen {
    namespace liemath {
        namespace se3 {

        // -----------------------------------------------------------------------------
        /**
         * \class Pose
         * \brief Rigid motion in SE(3): a proper rotation C and a translation r.
         *
         * The rotation is stored as a 3x3 matrix. Axis-angle vectors and quaternions are
         * converted on the way in (factories) and on the way out (`vec()`, `quaternion()`).
         * A Pose is never modified after construction; every operation returns a new one.
         *
         * Composition follows homogeneous matrices:
         *   [Ca ra] [Cb rb]   [Ca*Cb  Ca*rb + ra]
         *   [0  1 ] [0  1 ] = [0      1         ]
         */
        class Pose {

            public:

                // -----------------------------------------------------------------------------
                /** \brief Default constructor (identity pose) */
                Pose();

                // -----------------------------------------------------------------------------
                /**
                 * \brief Validating factory from a rotation matrix and a translation.
                 *
                 * Fails with ErrorKind::InvalidPose if C is not orthogonal with determinant +1
                 * within `tol`, or if any entry of C or r is not finite.
                 */
                static Result<Pose> Create(const Eigen::Ref<const Eigen::Matrix3d>& C,
                                           const Eigen::Ref<const Eigen::Vector3d>& r,
                                           double tol = 1e-6);

                // -----------------------------------------------------------------------------
                /**
                 * \brief Factory from an axis-angle rotation vector (exponential map) and a translation.
                 *
                 * Fails with ErrorKind::InvalidPose on non-finite input.
                 */
                static Result<Pose> FromRotationVector(const Eigen::Ref<const Eigen::Vector3d>& aaxis,
                                                       const Eigen::Ref<const Eigen::Vector3d>& r);

                // -----------------------------------------------------------------------------
                /** \brief Factory from a quaternion (normalized internally) and a translation. */
                static Result<Pose> FromQuaternion(const Eigen::Quaterniond& q,
                                                   const Eigen::Ref<const Eigen::Vector3d>& r);

                // -----------------------------------------------------------------------------
                /** \brief Rotation matrix. */
                const Eigen::Matrix3d& rotation() const noexcept { return C_; }

                // -----------------------------------------------------------------------------
                /** \brief Translation vector. */
                const Eigen::Vector3d& translation() const noexcept { return r_; }

                // -----------------------------------------------------------------------------
                /** \brief Rotation generator (axis-angle vector, logarithmic map). */
                Eigen::Vector3d vec() const noexcept;

                // -----------------------------------------------------------------------------
                /** \brief Rotation as a unit quaternion with non-negative scalar part. */
                Eigen::Quaterniond quaternion() const noexcept;

                // -----------------------------------------------------------------------------
                /** \brief 4x4 homogeneous matrix. */
                Eigen::Matrix4d matrix() const noexcept;

                // -----------------------------------------------------------------------------
                /** \brief Inverse motion: (C^T, -C^T r). */
                Pose inverse() const noexcept;

                // -----------------------------------------------------------------------------
                /** \brief Composition: `*this` applied after `T_rhs`. */
                Pose operator*(const Pose& T_rhs) const noexcept;

                // -----------------------------------------------------------------------------
                /** \brief Component-wise comparison within an absolute tolerance. */
                bool isApprox(const Pose& other, double tol = 1e-6) const noexcept;

            private:

                // -----------------------------------------------------------------------------
                /** \brief Unvalidated constructor for results of closed group operations. */
                Pose(const Eigen::Matrix3d& C, const Eigen::Vector3d& r);

                // -----------------------------------------------------------------------------
                /** \brief Re-projects C onto SO(3) when its determinant drifts from 1. */
                void reproject() noexcept;

                Eigen::Matrix3d C_;
                Eigen::Vector3d r_;
        };

        // -----------------------------------------------------------------------------
        // Group operations
        // -----------------------------------------------------------------------------

        /** @brief Neutral element. */
        Pose identity() noexcept;

        /** @brief `a` applied after `b`. */
        Pose compose(const Pose& a, const Pose& b) noexcept;

        /**
         * @brief Scales a pose by lambda.
         *
         * Translation scales linearly; rotation scales through its generator,
         * exp(lambda * log(C)). Fails with ErrorKind::InvalidScale for a non-finite lambda.
         */
        Result<Pose> scale(const Pose& pose, double lambda);

        // -----------------------------------------------------------------------------
        // Distances
        // -----------------------------------------------------------------------------

        /** @brief ||C - I||_F */
        double rotationError(const Pose& pose) noexcept;

        /** @brief ||r||_2 */
        double translationError(const Pose& pose) noexcept;

        /** @brief rotationError + translationError. Zero exactly at the identity. */
        double distanceToIdentity(const Pose& pose) noexcept;

        // -----------------------------------------------------------------------------
        // Adjoint
        // -----------------------------------------------------------------------------

        /**
         * @brief Conjugates a 4x4 element X by g.
         *
         *   Ad_g(X) = [C X_rr C^T   C X_t]
         *             [0            0    ]
         *
         * X_rr is the top-left 3x3 block of X and X_t its top-right column. Only the
         * rotation of g acts; its translation does not enter. The bottom row is zero.
         */
        Eigen::Matrix4d adjoint(const Pose& g, const Eigen::Matrix4d& X) noexcept;

        /**
         * @brief ||Ad_a(T_b) - T_b||_F with T_b the homogeneous matrix of b.
         *
         * Measures how much applying `a` first changes the effect of `b`. The adjoint
         * zeroes the homogeneous 1 of T_b, so the result is never below 1, and equals 1
         * when the rotation of `a` commutes with `b`.
         */
        double interventionInterference(const Pose& a, const Pose& b) noexcept;

        }  // namespace se3
    }  // namespace liemath
}  // namespace regen

// -----------------------------------------------------------------------------
/** \brief Print pose */
std::ostream& operator<<(std::ostream& out, const regen::liemath::se3::Pose& T);
