#include <cmath>
#include <stdexcept>

#include "Problem/ReturnObjective.hpp"
#include "Resonance/ResonanceDetector.hpp"

namespace regen {
    namespace resonance {

        // -----------------------------------------------------------------------------
        // standardConstants
        // -----------------------------------------------------------------------------

        std::vector<ResonanceConstant> standardConstants() {
            return {
                {"golden_ratio", GOLDEN_RATIO},
                {"silver_ratio", SILVER_RATIO},
                {"plastic_number", PLASTIC_NUMBER},
                {"octave", OCTAVE},
                {"perfect_fifth", PERFECT_FIFTH},
                {"perfect_fourth", PERFECT_FOURTH},
                {"major_third", MAJOR_THIRD},
            };
        }

        // -----------------------------------------------------------------------------
        // ResonanceDetector
        // -----------------------------------------------------------------------------

        ResonanceDetector::ResonanceDetector() : ResonanceDetector(Params()) {}

        ResonanceDetector::ResonanceDetector(const Params& params) : params_(params) {
            if (params_.constants.empty()) {
                throw std::invalid_argument("[ResonanceDetector::ResonanceDetector] At least one constant is required.");
            }
        }

        // -----------------------------------------------------------------------------
        // testScaling
        // -----------------------------------------------------------------------------

        double ResonanceDetector::testScaling(const traj::Trajectory& trajectory, double lambda) const {
            return problem::returnError(trajectory, lambda, true);
        }

        // -----------------------------------------------------------------------------
        // detect
        // -----------------------------------------------------------------------------

        ResonanceDetector::Detection ResonanceDetector::detect(const traj::Trajectory& trajectory) const {
            return detect(trajectory, params_.tolerance);
        }

        ResonanceDetector::Detection ResonanceDetector::detect(const traj::Trajectory& trajectory, double tolerance) const {
            Detection detection;
            detection.all_resonances.reserve(params_.constants.size());

            std::size_t best = 0;
            for (std::size_t i = 0; i < params_.constants.size(); ++i) {
                const auto& constant = params_.constants[i];
                const double error = testScaling(trajectory, constant.value);
                detection.all_resonances.emplace_back(constant.name, error);
                if (error < detection.all_resonances[best].second) best = i;
            }
            detection.best_resonance = detection.all_resonances[best].first;
            detection.best_error = detection.all_resonances[best].second;

            const solver::BoundedScalarSolver reference(params_.solver);
            const auto optimum = reference.optimize(trajectory, params_.search_bounds, true);
            detection.optimal_lambda = optimum.lambda;
            detection.optimal_error = optimum.epsilon;

            detection.is_natural = detection.best_error <= optimum.epsilon * (1.0 + tolerance);
            return detection;
        }

        // -----------------------------------------------------------------------------
        // nearest
        // -----------------------------------------------------------------------------

        ResonanceDetector::Nearest ResonanceDetector::nearest(double lambda) const {
            Nearest result;
            result.name = params_.constants.front().name;
            result.value = params_.constants.front().value;
            result.distance = std::abs(lambda - result.value);
            for (const auto& constant : params_.constants) {
                const double distance = std::abs(lambda - constant.value);
                if (distance < result.distance) {
                    result.name = constant.name;
                    result.value = constant.value;
                    result.distance = distance;
                }
            }
            return result;
        }

    }  // namespace resonance
}  // namespace regen
