#include "Resonance/ResonanceAwareOptimizer.hpp"

namespace regen {
    namespace resonance {

        // -----------------------------------------------------------------------------
        // ResonanceAwareOptimizer
        // -----------------------------------------------------------------------------

        ResonanceAwareOptimizer::ResonanceAwareOptimizer() : ResonanceAwareOptimizer(Params()) {}

        ResonanceAwareOptimizer::ResonanceAwareOptimizer(const Params& params) : params_(params) {}

        // -----------------------------------------------------------------------------
        // windowAround
        // -----------------------------------------------------------------------------

        solver::Bounds ResonanceAwareOptimizer::windowAround(double value) const {
            return solver::Bounds{params_.window_lower * value, params_.window_upper * value};
        }

        // -----------------------------------------------------------------------------
        // optimizeWithBias
        // -----------------------------------------------------------------------------

        ResonanceAwareOptimizer::Estimate ResonanceAwareOptimizer::optimizeWithBias(const traj::Trajectory& trajectory,
                                                                                    bool bias_to_golden) const {
            const solver::BoundedScalarSolver solver(params_.solver);

            if (!bias_to_golden) {
                const auto result = solver.optimize(trajectory, params_.fallback_bounds, true);
                return {result.lambda, result.epsilon};
            }

            const auto local = solver.optimize(trajectory, windowAround(GOLDEN_RATIO), true);
            if (local.epsilon <= params_.fallback_threshold) {
                return {local.lambda, local.epsilon};
            }

            const auto global = solver.optimize(trajectory, params_.fallback_bounds, true);
            if (params_.solver.verbose && params_.solver.log_stream) {
                *params_.solver.log_stream << "[ResonanceAwareOptimizer::optimizeWithBias] Golden window error "
                                           << local.epsilon << " above threshold, fallback error "
                                           << global.epsilon << std::endl;
            }
            if (global.epsilon < local.epsilon) return {global.lambda, global.epsilon};
            return {local.lambda, local.epsilon};
        }

        // -----------------------------------------------------------------------------
        // multiResonanceSearch
        // -----------------------------------------------------------------------------

        std::vector<std::pair<std::string, ResonanceAwareOptimizer::Estimate>>
        ResonanceAwareOptimizer::multiResonanceSearch(const traj::Trajectory& trajectory) const {
            const solver::BoundedScalarSolver solver(params_.solver);

            std::vector<std::pair<std::string, Estimate>> results;
            results.reserve(params_.constants.size());
            for (const auto& constant : params_.constants) {
                const auto result = solver.optimize(trajectory, windowAround(constant.value), true);
                results.emplace_back(constant.name, Estimate{result.lambda, result.epsilon});
            }
            return results;
        }

    }  // namespace resonance
}  // namespace regen
