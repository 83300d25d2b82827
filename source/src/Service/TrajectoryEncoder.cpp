#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "Service/TrajectoryEncoder.hpp"

namespace regen {
    namespace service {

        namespace {

            Error formatError(const std::string& where, const std::string& what) {
                return Error(ErrorKind::UnsupportedFormat, "[TrajectoryEncoder::" + where + "] " + what);
            }

            Error dimensionError(const std::string& where, const std::string& what) {
                return Error(ErrorKind::DimensionMismatch, "[TrajectoryEncoder::" + where + "] " + what);
            }

            // Reads the first `n` entries of a numeric array. Fails if the array is shorter
            // than `n` or any of those entries is not a number.
            Result<std::vector<double>> readRow(const Json::Value& row, Json::ArrayIndex n, const std::string& where) {
                if (!row.isArray()) {
                    return formatError(where, "Expected an array of numbers.");
                }
                if (row.size() < n) {
                    std::ostringstream ss;
                    ss << "Expected at least " << n << " values, got " << row.size() << ".";
                    return dimensionError(where, ss.str());
                }
                std::vector<double> values(n);
                for (Json::ArrayIndex i = 0; i < n; ++i) {
                    if (!row[i].isNumeric()) {
                        return formatError(where, "Non-numeric value in array.");
                    }
                    values[i] = row[i].asDouble();
                }
                return values;
            }

            Result<Eigen::Vector3d> readVector3(const Json::Value& row, const std::string& where) {
                auto values = readRow(row, 3, where);
                if (!values) return values.error();
                const auto& v = values.value();
                return Eigen::Vector3d(v[0], v[1], v[2]);
            }

            Result<traj::Pose> decodePose(const Json::Value& entry) {
                static const std::string where = "encodePoses";
                if (!entry.isObject() || !entry.isMember("rotation") || !entry.isMember("translation")) {
                    return formatError(where, "Each pose must contain 'rotation' and 'translation'.");
                }
                const Json::Value& rotation = entry["rotation"];
                const Json::Value& translation = entry["translation"];

                if (!translation.isArray() || translation.size() != 3) {
                    return dimensionError(where, "Translation must have 3 components.");
                }
                auto r = readVector3(translation, where);
                if (!r) return r.error();

                if (!rotation.isArray()) {
                    return formatError(where, "Rotation must be an array.");
                }
                if (rotation.size() == 3 && !rotation[0].isArray()) {
                    auto aaxis = readVector3(rotation, where);
                    if (!aaxis) return aaxis.error();
                    return traj::Pose::FromRotationVector(aaxis.value(), r.value());
                }
                if (rotation.size() == 3) {
                    Eigen::Matrix3d C;
                    for (Json::ArrayIndex i = 0; i < 3; ++i) {
                        if (!rotation[i].isArray() || rotation[i].size() != 3) {
                            return dimensionError(where, "Rotation matrix must be 3x3.");
                        }
                        auto row = readVector3(rotation[i], where);
                        if (!row) return row.error();
                        C.row(static_cast<Eigen::Index>(i)) = row.value().transpose();
                    }
                    return traj::Pose::Create(C, r.value());
                }
                return dimensionError(where, "Rotation must be a 3-vector or a 3x3 matrix.");
            }

        }  // namespace

        // -----------------------------------------------------------------------------
        // encode
        // -----------------------------------------------------------------------------

        Result<traj::Trajectory> TrajectoryEncoder::encode(const Json::Value& data, bool bounded, double r_max) {
            if (data.isArray()) {
                return encodePoses(data, bounded, r_max);
            }
            if (!data.isObject()) {
                return formatError("encode", "Trajectory data must be an object or an array of poses.");
            }
            if (data.isMember("poses")) {
                return encodePoses(data["poses"], bounded, r_max);
            }
            if (data.isMember("positions") && data.isMember("orientations")) {
                return encodeTimeSeries(data["positions"], data["orientations"], bounded, r_max);
            }
            if (data.isMember("state_vectors")) {
                return encodeStateVectors(data["state_vectors"], bounded, r_max);
            }
            return formatError("encode",
                "Expected 'poses', 'positions' + 'orientations', or 'state_vectors'.");
        }

        // -----------------------------------------------------------------------------
        // encodePoses
        // -----------------------------------------------------------------------------

        Result<traj::Trajectory> TrajectoryEncoder::encodePoses(const Json::Value& poses, bool bounded, double r_max) {
            if (!poses.isArray()) {
                return formatError("encodePoses", "'poses' must be an array.");
            }
            std::vector<traj::Pose> decoded;
            decoded.reserve(poses.size());
            for (const auto& entry : poses) {
                auto pose = decodePose(entry);
                if (!pose) return pose.error();
                decoded.push_back(std::move(pose).value());
            }
            return traj::Trajectory::Create(std::move(decoded), bounded, r_max);
        }

        // -----------------------------------------------------------------------------
        // encodeTimeSeries
        // -----------------------------------------------------------------------------

        Result<traj::Trajectory> TrajectoryEncoder::encodeTimeSeries(const Json::Value& positions,
                                                                     const Json::Value& orientations,
                                                                     bool bounded,
                                                                     double r_max) {
            static const std::string where = "encodeTimeSeries";
            if (!positions.isArray() || !orientations.isArray()) {
                return formatError(where, "'positions' and 'orientations' must be arrays.");
            }
            if (positions.size() != orientations.size()) {
                std::ostringstream ss;
                ss << "Positions (" << positions.size() << ") and orientations ("
                   << orientations.size() << ") must have the same length.";
                return dimensionError(where, ss.str());
            }

            std::vector<traj::Pose> decoded;
            decoded.reserve(positions.size());
            Eigen::Vector3d prev_position = Eigen::Vector3d::Zero();
            Eigen::Vector3d prev_orientation = Eigen::Vector3d::Zero();
            for (Json::ArrayIndex i = 0; i < positions.size(); ++i) {
                auto position = readVector3(positions[i], where);
                if (!position) return position.error();
                auto orientation = readVector3(orientations[i], where);
                if (!orientation) return orientation.error();

                auto pose = (i == 0)
                    ? traj::Pose::FromRotationVector(Eigen::Vector3d::Zero(), position.value())
                    : traj::Pose::FromRotationVector(orientation.value() - prev_orientation,
                                                     position.value() - prev_position);
                if (!pose) return pose.error();
                decoded.push_back(std::move(pose).value());

                prev_position = position.value();
                prev_orientation = orientation.value();
            }
            return traj::Trajectory::Create(std::move(decoded), bounded, r_max);
        }

        // -----------------------------------------------------------------------------
        // encodeStateVectors
        // -----------------------------------------------------------------------------

        Result<traj::Trajectory> TrajectoryEncoder::encodeStateVectors(const Json::Value& state_vectors,
                                                                       bool bounded,
                                                                       double r_max) {
            static const std::string where = "encodeStateVectors";
            if (!state_vectors.isArray()) {
                return formatError(where, "'state_vectors' must be an array.");
            }

            std::vector<traj::Pose> decoded;
            decoded.reserve(state_vectors.size());
            for (const auto& row : state_vectors) {
                auto values = readRow(row, 6, where);
                if (!values) return values.error();
                const auto& v = values.value();
                auto pose = traj::Pose::FromRotationVector(Eigen::Vector3d(v[0], v[1], v[2]),
                                                           Eigen::Vector3d(v[3], v[4], v[5]));
                if (!pose) return pose.error();
                decoded.push_back(std::move(pose).value());
            }
            return traj::Trajectory::Create(std::move(decoded), bounded, r_max);
        }

    }  // namespace service
}  // namespace regen
