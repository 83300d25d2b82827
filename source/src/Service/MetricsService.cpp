#include <algorithm>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "Common/Timer.hpp"
#include "Service/MetricsService.hpp"
#include "Service/TrajectoryEncoder.hpp"

namespace regen {
    namespace service {

        namespace {

            Error optionError(const std::string& key, const std::string& expected) {
                return Error(ErrorKind::UnsupportedFormat,
                             "[MetricsOptions::FromJson] Option '" + key + "' must be " + expected + ".");
            }

            bool readBool(const Json::Value& options, const char* key, bool fallback) {
                if (!options.isMember(key)) return fallback;
                if (!options[key].isBool()) throw optionError(key, "a boolean");
                return options[key].asBool();
            }

            double readDouble(const Json::Value& options, const char* key, double fallback) {
                if (!options.isMember(key)) return fallback;
                if (!options[key].isNumeric()) throw optionError(key, "a number");
                return options[key].asDouble();
            }

        }  // namespace

        // -----------------------------------------------------------------------------
        // MetricsOptions::FromJson
        // -----------------------------------------------------------------------------

        MetricsOptions MetricsOptions::FromJson(const Json::Value& options, const MetricsOptions& defaults) {
            MetricsOptions result = defaults;
            if (options.isNull()) return result;
            if (!options.isObject()) {
                throw Error(ErrorKind::UnsupportedFormat, "[MetricsOptions::FromJson] 'options' must be an object.");
            }

            result.enable_resonance_detection =
                readBool(options, "enable_resonance_detection", result.enable_resonance_detection);
            result.enable_verification_cascade =
                readBool(options, "enable_verification_cascade", result.enable_verification_cascade);
            result.bounded = readBool(options, "bounded", result.bounded);
            result.r_max = readDouble(options, "r_max", result.r_max);

            if (options.isMember("lambda_bounds")) {
                const Json::Value& bounds = options["lambda_bounds"];
                if (!bounds.isArray() || bounds.size() != 2 || !bounds[0].isNumeric() || !bounds[1].isNumeric()) {
                    throw optionError("lambda_bounds", "an array [lower, upper]");
                }
                result.lambda_bounds = solver::Bounds{bounds[0].asDouble(), bounds[1].asDouble()};
            }

            if (options.isMember("seed")) {
                if (!options["seed"].isUInt64()) throw optionError("seed", "a non-negative integer");
                result.cascade.seed = options["seed"].asUInt64();
            }
            return result;
        }

        MetricsOptions MetricsOptions::FromJson(const Json::Value& options) {
            return FromJson(options, MetricsOptions());
        }

        // -----------------------------------------------------------------------------
        // MetricsService
        // -----------------------------------------------------------------------------

        MetricsService::MetricsService() : MetricsService(MetricsOptions()) {}

        MetricsService::MetricsService(const MetricsOptions& options) : options_(options) {}

        // -----------------------------------------------------------------------------
        // computeMetrics
        // -----------------------------------------------------------------------------

        RegenerativeMetrics MetricsService::computeMetrics(const Json::Value& trajectory_data) const {
            common::Timer timer;
            const bool log = options_.verbose && options_.log_stream;

            const traj::Trajectory trajectory =
                TrajectoryEncoder::encode(trajectory_data, options_.bounded, options_.r_max).value();
            if (log) {
                *options_.log_stream << "[MetricsService::computeMetrics] Encoded trajectory with "
                                     << trajectory.size() << " poses" << std::endl;
            }

            const solver::BoundedScalarSolver solver(options_.solver);
            const auto optimum = solver.optimize(trajectory, options_.lambda_bounds, true);
            if (log) {
                *options_.log_stream << "[MetricsService::computeMetrics] Optimal lambda: " << optimum.lambda
                                     << ", return error: " << optimum.epsilon << std::endl;
            }

            RegenerativeMetrics metrics;
            metrics.optimal_lambda = optimum.lambda;
            metrics.return_error_epsilon = optimum.epsilon;

            if (options_.enable_resonance_detection) {
                const resonance::ResonanceDetector detector(options_.resonance);
                const auto detection = detector.detect(trajectory);
                if (detection.is_natural) {
                    metrics.resonance_detected = detection.best_resonance;
                    if (log) {
                        *options_.log_stream << "[MetricsService::computeMetrics] Resonance detected: "
                                             << detection.best_resonance << std::endl;
                    }
                }
            }

            if (options_.enable_verification_cascade) {
                const verification::VerificationCascade cascade(options_.cascade);
                const auto verification = cascade.verify(trajectory, optimum.lambda, options_.base_unit);
                metrics.verification_score = verification.overall_score;
                if (log) {
                    *options_.log_stream << "[MetricsService::computeMetrics] Verification score: "
                                         << verification.overall_score << std::endl;
                }
            }

            metrics.confidence = confidenceFrom(optimum.epsilon, optimum.converged);
            if (log && !optimum.converged) {
                *options_.log_stream << "[MetricsService::computeMetrics] Warning: optimization did not converge ("
                                     << optimum.termination << ")" << std::endl;
            }

            metrics.metadata.trajectory_length = trajectory.size();
            metrics.metadata.bounded = options_.bounded;
            metrics.metadata.r_max = options_.r_max;
            metrics.metadata.lambda_bounds = options_.lambda_bounds;
            metrics.metadata.optimization_success = optimum.converged;
            metrics.metadata.optimization_evaluations = optimum.evaluations;

            if (log) {
                *options_.log_stream << "[MetricsService::computeMetrics] Total time: "
                                     << timer.milliseconds() << " ms" << std::endl;
            }
            return metrics;
        }

        // -----------------------------------------------------------------------------
        // computeBatch
        // -----------------------------------------------------------------------------

        std::vector<BatchEntry> MetricsService::computeBatch(const Json::Value& trajectories) const {
            if (!trajectories.isArray()) {
                throw Error(ErrorKind::UnsupportedFormat, "[MetricsService::computeBatch] 'trajectories' must be an array.");
            }

            std::vector<BatchEntry> entries(trajectories.size());
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, entries.size()),
                [&](const tbb::blocked_range<std::size_t>& range) {
                    for (std::size_t i = range.begin(); i != range.end(); ++i) {
                        entries[i].index = i;
                        try {
                            entries[i].metrics = computeMetrics(trajectories[static_cast<Json::ArrayIndex>(i)]);
                        } catch (const Error& e) {
                            entries[i].error = e;
                        }
                    }
                });

            if (options_.verbose && options_.log_stream) {
                const auto failed = std::count_if(entries.begin(), entries.end(),
                                                  [](const BatchEntry& entry) { return !entry.ok(); });
                *options_.log_stream << "[MetricsService::computeBatch] Processed " << entries.size()
                                     << " trajectories, " << failed << " failed" << std::endl;
            }
            return entries;
        }

        // -----------------------------------------------------------------------------
        // confidenceFrom
        // -----------------------------------------------------------------------------

        double confidenceFrom(double epsilon, bool converged) noexcept {
            if (!converged) return 0.5;
            return std::min(1.0, 1.0 / (1.0 + epsilon));
        }

        // -----------------------------------------------------------------------------
        // toJson
        // -----------------------------------------------------------------------------

        Json::Value toJson(const RegenerativeMetrics& metrics) {
            Json::Value out(Json::objectValue);
            out["optimal_lambda"] = metrics.optimal_lambda;
            out["return_error_epsilon"] = metrics.return_error_epsilon;
            out["verification_score"] = metrics.verification_score;
            out["resonance_detected"] = metrics.resonance_detected ? Json::Value(*metrics.resonance_detected)
                                                                   : Json::Value(Json::nullValue);
            out["confidence"] = metrics.confidence;

            Json::Value bounds(Json::arrayValue);
            bounds.append(metrics.metadata.lambda_bounds.lower);
            bounds.append(metrics.metadata.lambda_bounds.upper);

            Json::Value metadata(Json::objectValue);
            metadata["trajectory_length"] = static_cast<Json::UInt64>(metrics.metadata.trajectory_length);
            metadata["bounded"] = metrics.metadata.bounded;
            metadata["r_max"] = metrics.metadata.r_max;
            metadata["lambda_bounds"] = bounds;
            metadata["optimization_success"] = metrics.metadata.optimization_success;
            metadata["optimization_evaluations"] = metrics.metadata.optimization_evaluations;
            out["metadata"] = metadata;
            return out;
        }

        Json::Value toJson(const BatchEntry& entry) {
            if (entry.metrics) {
                Json::Value out = toJson(*entry.metrics);
                out["trajectory_index"] = static_cast<Json::UInt64>(entry.index);
                return out;
            }
            Json::Value out(Json::objectValue);
            out["error"] = entry.error ? entry.error->what() : "unknown error";
            out["error_kind"] = entry.error ? toString(entry.error->kind()) : "";
            out["trajectory_index"] = static_cast<Json::UInt64>(entry.index);
            return out;
        }

        Json::Value toJson(const std::vector<BatchEntry>& entries) {
            Json::Value out(Json::arrayValue);
            for (const auto& entry : entries) out.append(toJson(entry));
            return out;
        }

    }  // namespace service
}  // namespace regen
