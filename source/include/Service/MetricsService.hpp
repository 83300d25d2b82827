#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "Common/Error.hpp"
#include "Resonance/ResonanceDetector.hpp"
#include "Solver/BoundedScalarSolver.hpp"
#include "Verification/VerificationCascade.hpp"

namespace regen {
    namespace service {

        // -----------------------------------------------------------------------------
        /** @brief Configuration of a metrics computation. */
        struct MetricsOptions {
            bool enable_resonance_detection = true;
            bool enable_verification_cascade = true;

            bool bounded = true;
            double r_max = 1.0;

            solver::Bounds lambda_bounds{0.1, 2.0};

            /// @brief Reward base passed to the verification cascade.
            double base_unit = 100.0;

            solver::BoundedScalarSolver::Params solver;
            resonance::ResonanceDetector::Params resonance;
            verification::VerificationCascade::Params cascade;

            /// @brief Enable verbose logging of the pipeline stages.
            bool verbose = false;

            /// @brief Destination of verbose output.
            std::ostream* log_stream = &std::cout;

            // -----------------------------------------------------------------------------
            /**
             * @brief Overrides `defaults` with the keys present in a request's "options" object.
             *
             * Recognized keys: enable_resonance_detection, enable_verification_cascade, bounded,
             * r_max, lambda_bounds ([lower, upper]) and seed. Throws regen::Error
             * (UnsupportedFormat) when a key has the wrong type.
             */
            static MetricsOptions FromJson(const Json::Value& options, const MetricsOptions& defaults);
            static MetricsOptions FromJson(const Json::Value& options);
        };

        // -----------------------------------------------------------------------------
        struct RegenerativeMetrics {
            double optimal_lambda = 0.0;
            double return_error_epsilon = 0.0;
            double verification_score = 0.0;
            std::optional<std::string> resonance_detected;
            double confidence = 1.0;

            struct Metadata {
                std::size_t trajectory_length = 0;
                bool bounded = true;
                double r_max = 1.0;
                solver::Bounds lambda_bounds;
                bool optimization_success = false;
                unsigned int optimization_evaluations = 0;
            } metadata;
        };

        // -----------------------------------------------------------------------------
        /** @brief Batch result slot. Exactly one of `metrics` / `error` is set. */
        struct BatchEntry {
            std::size_t index = 0;
            std::optional<RegenerativeMetrics> metrics;
            std::optional<Error> error;

            bool ok() const noexcept { return metrics.has_value(); }
        };

        // -----------------------------------------------------------------------------
        /**
         * @class MetricsService
         * @brief Encode -> optimize -> resonance -> cascade pipeline over JSON trajectory data.
         */
        class MetricsService {
            public:
                MetricsService();
                explicit MetricsService(const MetricsOptions& options);

                // -----------------------------------------------------------------------------
                /**
                 * @brief Metrics of a single trajectory.
                 *
                 * Throws regen::Error if the data cannot be encoded into a valid trajectory.
                 */
                RegenerativeMetrics computeMetrics(const Json::Value& trajectory_data) const;

                // -----------------------------------------------------------------------------
                /**
                 * @brief Metrics of every trajectory in `trajectories`, computed in parallel.
                 *
                 * The result has one entry per input, in input order. A failing trajectory
                 * yields an entry carrying its error; the others are unaffected.
                 */
                std::vector<BatchEntry> computeBatch(const Json::Value& trajectories) const;

                const MetricsOptions& options() const noexcept { return options_; }

            private:
                const MetricsOptions options_;
        };

        // -----------------------------------------------------------------------------
        /** @brief confidence = min(1, 1 / (1 + epsilon)) when converged, 0.5 otherwise. */
        double confidenceFrom(double epsilon, bool converged) noexcept;

        Json::Value toJson(const RegenerativeMetrics& metrics);
        Json::Value toJson(const BatchEntry& entry);
        Json::Value toJson(const std::vector<BatchEntry>& entries);

    }  // namespace service
}  // namespace regen
