#pragma once

#include <json/json.h>

#include "Common/Result.hpp"
#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace service {

        // -----------------------------------------------------------------------------
        /**
         * @class TrajectoryEncoder
         * @brief Builds trajectories from JSON-encoded motion data.
         *
         * Accepted shapes:
         *  - {"poses": [{"rotation": [3] | [3][3], "translation": [3]}, ...]} or a bare array of poses
         *  - {"positions": [[x, y, z], ...], "orientations": [[...], ...]}
         *  - {"state_vectors": [[d0, ..., d5, ...], ...]}
         */
        class TrajectoryEncoder {
            public:
                /** @brief Dispatches on the shape of `data`. Unknown shapes fail with UnsupportedFormat. */
                static Result<traj::Trajectory> encode(const Json::Value& data, bool bounded = true, double r_max = 1.0);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Explicit poses. A 3-vector rotation is an axis-angle, a 3x3 one a matrix.
                 */
                static Result<traj::Trajectory> encodePoses(const Json::Value& poses, bool bounded = true, double r_max = 1.0);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Sensor time series, converted to incremental poses.
                 *
                 * pose[0] = (I, position[0]); pose[i] = (exp(orientation[i] - orientation[i-1]), position[i] - position[i-1]).
                 * Only the first three orientation components are used, so quaternion rows are
                 * accepted as well.
                 */
                static Result<traj::Trajectory> encodeTimeSeries(const Json::Value& positions,
                                                                 const Json::Value& orientations,
                                                                 bool bounded = true,
                                                                 double r_max = 1.0);

                // -----------------------------------------------------------------------------
                /** @brief Rows of at least six values: axis-angle (0..2) then translation (3..5). */
                static Result<traj::Trajectory> encodeStateVectors(const Json::Value& state_vectors,
                                                                   bool bounded = true,
                                                                   double r_max = 1.0);
        };

    }  // namespace service
}  // namespace regen
