#pragma once

// ==================== SO(3): Special Orthogonal Group in 3D ====================
#include "LGMath/so3/Operations.hpp"      ///< exp / log maps and rotation checks

// ==================== SE(3): Special Euclidean Group in 3D ====================
#include "LGMath/se3/Pose.hpp"            ///< Validated pose, compose, scale, distance
