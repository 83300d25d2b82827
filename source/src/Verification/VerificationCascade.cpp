#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "Common/Timer.hpp"
#include "Problem/ReturnObjective.hpp"
#include "Verification/VerificationCascade.hpp"

namespace regen {
    namespace verification {

        namespace {

            double normalizeLowerIsBetter(double raw, double divisor) {
                return std::max(0.0, 1.0 - raw / divisor);
            }

            traj::Trajectory perturb(const traj::Trajectory& trajectory, double noise_std, std::mt19937_64& engine) {
                if (noise_std == 0.0) return trajectory;

                std::normal_distribution<double> noise(0.0, noise_std);
                std::vector<traj::Pose> poses;
                poses.reserve(trajectory.size());
                for (const auto& pose : trajectory.poses()) {
                    Eigen::Vector3d aaxis = pose.vec();
                    Eigen::Vector3d r = pose.translation();
                    for (int k = 0; k < 3; ++k) aaxis[k] += noise(engine);
                    for (int k = 0; k < 3; ++k) r[k] += noise(engine);
                    poses.push_back(traj::Pose::FromRotationVector(aaxis, r).value());
                }
                // Noise may push translations past r_max
                return traj::Trajectory::Unvalidated(std::move(poses), trajectory.bounded(), trajectory.rMax());
            }

        }  // namespace

        // -----------------------------------------------------------------------------
        // VerificationCascade
        // -----------------------------------------------------------------------------

        VerificationCascade::VerificationCascade() : VerificationCascade(Params()) {}

        VerificationCascade::VerificationCascade(const Params& params) : params_(params) {
            if (!std::isfinite(params_.noise_std) || params_.noise_std < 0.0) {
                throw std::invalid_argument("[VerificationCascade::VerificationCascade] noise_std must be finite and non-negative.");
            }
            if (params_.noise_trials == 0) {
                throw std::invalid_argument("[VerificationCascade::VerificationCascade] At least one noise trial is required.");
            }
        }

        // -----------------------------------------------------------------------------
        // returnQuality
        // -----------------------------------------------------------------------------

        double VerificationCascade::returnQuality(const traj::Trajectory& trajectory, double lambda) const {
            return problem::returnError(trajectory, lambda, true);
        }

        // -----------------------------------------------------------------------------
        // energyImbalance
        // -----------------------------------------------------------------------------

        double VerificationCascade::energyImbalance(const traj::Trajectory& trajectory, double lambda) const {
            const traj::Trajectory doubled = traj::doubleTrajectory(traj::scaleTrajectory(trajectory, lambda).value());
            double total_work = 0.0;
            for (const auto& pose : doubled.poses()) {
                total_work += pose.vec().norm() + pose.translation().norm();
            }
            return total_work / static_cast<double>(doubled.size());
        }

        // -----------------------------------------------------------------------------
        // timingVariation
        // -----------------------------------------------------------------------------

        double VerificationCascade::timingVariation(const traj::Trajectory& trajectory) const {
            if (trajectory.size() < 2) return 0.0;

            std::vector<double> steps;
            steps.reserve(trajectory.size() - 1);
            for (std::size_t i = 0; i + 1 < trajectory.size(); ++i) {
                const auto& p1 = trajectory[i];
                const auto& p2 = trajectory[i + 1];
                steps.push_back((p2.vec() - p1.vec()).norm() + (p2.translation() - p1.translation()).norm());
            }

            const double n = static_cast<double>(steps.size());
            const double mean = std::accumulate(steps.begin(), steps.end(), 0.0) / n;
            if (mean < 1e-10) return 0.0;

            double var = 0.0;
            for (double s : steps) var += (s - mean) * (s - mean);
            return std::sqrt(var / n) / mean;
        }

        // -----------------------------------------------------------------------------
        // boundedDomain
        // -----------------------------------------------------------------------------

        double VerificationCascade::boundedDomain(const traj::Trajectory& trajectory) const {
            return trajectory.withinBounds() ? 1.0 : 0.0;
        }

        // -----------------------------------------------------------------------------
        // noiseRobustness
        // -----------------------------------------------------------------------------

        double VerificationCascade::noiseRobustness(const traj::Trajectory& trajectory, double lambda) const {
            const double baseline = problem::returnError(trajectory, lambda, true);
            const std::uint64_t seed = params_.seed ? *params_.seed : std::random_device{}();
            const double noise_std = params_.noise_std;

            std::vector<double> noisy_errors(params_.noise_trials, 0.0);
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, noisy_errors.size()),
                [&](const tbb::blocked_range<std::size_t>& range) {
                    for (std::size_t trial = range.begin(); trial != range.end(); ++trial) {
                        std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffu),
                                          static_cast<std::uint32_t>(seed >> 32),
                                          static_cast<std::uint32_t>(trial)};
                        std::mt19937_64 engine(seq);
                        const traj::Trajectory noisy = perturb(trajectory, noise_std, engine);
                        noisy_errors[trial] = problem::returnError(noisy, lambda, true);
                    }
                });

            const double mean_noisy = std::accumulate(noisy_errors.begin(), noisy_errors.end(), 0.0)
                                      / static_cast<double>(noisy_errors.size());
            if (baseline < 1e-10) return params_.zero_baseline_robustness;

            const double degradation = (mean_noisy - baseline) / baseline;
            return std::clamp(1.0 - degradation, 0.0, 1.0);
        }

        // -----------------------------------------------------------------------------
        // verify
        // -----------------------------------------------------------------------------

        VerificationResult VerificationCascade::verify(const traj::Trajectory& trajectory,
                                                       double lambda,
                                                       double base_unit) const {
            common::Timer timer;
            VerificationResult result;

            result.raw.topological = returnQuality(trajectory, lambda);
            result.raw.energetic = energyImbalance(trajectory, lambda);
            result.raw.temporal = timingVariation(trajectory);
            result.raw.spatial = boundedDomain(trajectory);
            result.raw.stochastic = noiseRobustness(trajectory, lambda);

            result.normalized.topological = normalizeLowerIsBetter(result.raw.topological, params_.topological_divisor);
            result.normalized.energetic = normalizeLowerIsBetter(result.raw.energetic, params_.energetic_divisor);
            result.normalized.temporal = normalizeLowerIsBetter(result.raw.temporal, params_.temporal_divisor);
            result.normalized.spatial = result.raw.spatial;
            result.normalized.stochastic = result.raw.stochastic;

            const LevelValues& w = params_.weights;
            result.overall_score = w.topological * result.normalized.topological
                                 + w.energetic * result.normalized.energetic
                                 + w.temporal * result.normalized.temporal
                                 + w.spatial * result.normalized.spatial
                                 + w.stochastic * result.normalized.stochastic;

            const LevelValues& th = params_.thresholds;
            result.passed = result.raw.topological <= th.topological
                         && result.raw.energetic <= th.energetic
                         && result.raw.temporal <= th.temporal
                         && result.raw.stochastic >= th.stochastic
                         && result.raw.spatial == 1.0;

            result.reward = result.overall_score * base_unit;

            if (params_.verbose && params_.log_stream) {
                *params_.log_stream << "[VerificationCascade::verify] raw: " << result.raw
                                    << ", overall: " << result.overall_score
                                    << ", passed: " << (result.passed ? "true" : "false")
                                    << ", time: " << timer.milliseconds() << " ms" << std::endl;
            }
            return result;
        }

        // -----------------------------------------------------------------------------
        // operator<<
        // -----------------------------------------------------------------------------

        std::ostream& operator<<(std::ostream& out, const LevelValues& values) {
            out << "{topological: " << values.topological
                << ", energetic: " << values.energetic
                << ", temporal: " << values.temporal
                << ", spatial: " << values.spatial
                << ", stochastic: " << values.stochastic << "}";
            return out;
        }

    }  // namespace verification
}  // namespace regen
