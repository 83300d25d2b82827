#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace regen {

    // -----------------------------------------------------------------------------
    /**
     * @brief Failure categories raised by pose, trajectory and encoder construction.
     */
    enum class ErrorKind {
        InvalidPose,        ///< Rotation not orthogonal / not proper, or non-finite entries.
        BoundsViolation,    ///< Translation exceeds r_max on a bounded trajectory, or invalid r_max.
        InvalidScale,       ///< Non-finite scale factor or invalid search bounds.
        UnsupportedFormat,  ///< Unrecognized trajectory encoding.
        DimensionMismatch,  ///< Mismatched sequence lengths or insufficient vector width.
        EmptyTrajectory     ///< Trajectory without poses.
    };

    // -----------------------------------------------------------------------------
    /** @brief Returns the canonical name of an error kind (e.g. "InvalidPose"). */
    const char* toString(ErrorKind kind) noexcept;

    // -----------------------------------------------------------------------------
    /**
     * @brief Exception carrying an ErrorKind.
     *
     * Raised at the service boundary. Lower layers report the same information
     * through `Result<T>` so that trial loops do not rely on exceptions.
     */
    class Error : public std::runtime_error {
        public:
            Error(ErrorKind kind, const std::string& message)
                : std::runtime_error(message), kind_(kind) {}

            ErrorKind kind() const noexcept { return kind_; }

        private:
            ErrorKind kind_;
    };

    // -----------------------------------------------------------------------------
    std::ostream& operator<<(std::ostream& out, ErrorKind kind);

}  // namespace regen
