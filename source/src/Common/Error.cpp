#include "Common/Error.hpp"

namespace regen {

    // -----------------------------------------------------------------------------
    // toString
    // -----------------------------------------------------------------------------

    const char* toString(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::InvalidPose:       return "InvalidPose";
            case ErrorKind::BoundsViolation:   return "BoundsViolation";
            case ErrorKind::InvalidScale:      return "InvalidScale";
            case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
            case ErrorKind::DimensionMismatch: return "DimensionMismatch";
            case ErrorKind::EmptyTrajectory:   return "EmptyTrajectory";
        }
        return "Unknown";
    }

    // -----------------------------------------------------------------------------
    // operator<<
    // -----------------------------------------------------------------------------

    std::ostream& operator<<(std::ostream& out, ErrorKind kind) {
        out << toString(kind);
        return out;
    }

}  // namespace regen
