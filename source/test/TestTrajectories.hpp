#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>
#include <json/json.h>

#include "Trajectory/Trajectory.hpp"

namespace regen {
    namespace test {

        inline traj::Pose makePose(const Eigen::Vector3d& aaxis, const Eigen::Vector3d& r) {
            return traj::Pose::FromRotationVector(aaxis, r).value();
        }

        // The four-step loop used throughout: +x, +y, -x, -y with small rotations.
        inline traj::Trajectory squareLoop(bool bounded = true, double r_max = 1.0) {
            std::vector<traj::Pose> poses{
                makePose(Eigen::Vector3d(0.1, 0.0, 0.0), Eigen::Vector3d(0.5, 0.0, 0.0)),
                makePose(Eigen::Vector3d(0.0, 0.1, 0.0), Eigen::Vector3d(0.0, 0.5, 0.0)),
                makePose(Eigen::Vector3d(-0.1, 0.0, 0.0), Eigen::Vector3d(-0.5, 0.0, 0.0)),
                makePose(Eigen::Vector3d(0.0, -0.1, 0.0), Eigen::Vector3d(0.0, -0.5, 0.0)),
            };
            return traj::Trajectory::Create(std::move(poses), bounded, r_max).value();
        }

        // Second half is the exact inverse of the first, so the composition is the identity.
        inline traj::Trajectory selfCancelling() {
            const traj::Pose a = makePose(Eigen::Vector3d(0.2, -0.1, 0.3), Eigen::Vector3d(0.3, 0.1, -0.2));
            const traj::Pose b = makePose(Eigen::Vector3d(-0.4, 0.2, 0.1), Eigen::Vector3d(-0.1, 0.4, 0.2));
            std::vector<traj::Pose> poses{a, b, b.inverse(), a.inverse()};
            return traj::Trajectory::Create(std::move(poses), true, 1.0).value();
        }

        inline Json::Value parseJson(const std::string& text) {
            Json::CharReaderBuilder builder;
            Json::Value value;
            std::string errors;
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
            if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
                throw std::runtime_error("test JSON does not parse: " + errors);
            }
            return value;
        }

        inline const char* squareLoopJson() {
            return R"({"poses": [
                {"rotation": [0.1, 0, 0], "translation": [0.5, 0, 0]},
                {"rotation": [0, 0.1, 0], "translation": [0, 0.5, 0]},
                {"rotation": [-0.1, 0, 0], "translation": [-0.5, 0, 0]},
                {"rotation": [0, -0.1, 0], "translation": [0, -0.5, 0]}
            ]})";
        }

    }  // namespace test
}  // namespace regen
