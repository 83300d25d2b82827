#include <algorithm>
#include <cmath>
#include <limits>

#include "Common/Timer.hpp"
#include "Problem/ReturnObjective.hpp"
#include "Solver/BoundedScalarSolver.hpp"

namespace regen {
    namespace solver {

        namespace {

            // sign(x), with sign(0) = 1
            double signOrOne(double x) {
                return (x > 0.0) ? 1.0 : ((x < 0.0) ? -1.0 : 1.0);
            }

        }  // namespace

        // -----------------------------------------------------------------------------
        // BoundedScalarSolver
        // -----------------------------------------------------------------------------

        BoundedScalarSolver::BoundedScalarSolver() : BoundedScalarSolver(Params()) {}

        BoundedScalarSolver::BoundedScalarSolver(const Params& params) : params_(params) {}

        // -----------------------------------------------------------------------------
        // minimize
        // -----------------------------------------------------------------------------

        BoundedScalarSolver::Result BoundedScalarSolver::minimize(const Objective& objective, const Bounds& bounds) const {
            if (!std::isfinite(bounds.lower) || !std::isfinite(bounds.upper)) {
                throw Error(ErrorKind::InvalidScale, "[BoundedScalarSolver::minimize] Bounds must be finite.");
            }
            if (bounds.lower > bounds.upper) {
                throw Error(ErrorKind::InvalidScale, "[BoundedScalarSolver::minimize] Lower bound exceeds upper bound.");
            }

            const double sqrt_eps = std::sqrt(2.2e-16);
            const double golden_mean = 0.5 * (3.0 - std::sqrt(5.0));
            const double xatol = params_.xatol;

            double a = bounds.lower;
            double b = bounds.upper;

            // xf: best point, nfc: second best, fulc: previous second best
            double fulc = a + golden_mean * (b - a);
            double nfc = fulc;
            double xf = fulc;
            double rat = 0.0;
            double e = 0.0;
            double x = xf;
            double fx = objective(x);
            unsigned int num = 1;
            double fu = std::numeric_limits<double>::infinity();

            double ffulc = fx;
            double fnfc = fx;
            double xm = 0.5 * (a + b);
            double tol1 = sqrt_eps * std::abs(xf) + xatol / 3.0;
            double tol2 = 2.0 * tol1;

            Termination term = TERMINATE_CONVERGED_BRACKET;

            while (std::abs(xf - xm) > (tol2 - 0.5 * (b - a))) {
                bool golden = true;

                // Parabolic fit through (xf, fx), (nfc, fnfc), (fulc, ffulc)
                if (std::abs(e) > tol1) {
                    golden = false;
                    double r = (xf - nfc) * (fx - ffulc);
                    double q = (xf - fulc) * (fx - fnfc);
                    double p = (xf - fulc) * q - (xf - nfc) * r;
                    q = 2.0 * (q - r);
                    if (q > 0.0) p = -p;
                    q = std::abs(q);
                    r = e;
                    e = rat;

                    if ((std::abs(p) < std::abs(0.5 * q * r)) && (p > q * (a - xf)) && (p < q * (b - xf))) {
                        rat = p / q;
                        x = xf + rat;
                        // Keep away from the interval ends
                        if (((x - a) < tol2) || ((b - x) < tol2)) {
                            rat = tol1 * signOrOne(xm - xf);
                        }
                    } else {
                        golden = true;
                    }
                }

                if (golden) {
                    e = (xf >= xm) ? (a - xf) : (b - xf);
                    rat = golden_mean * e;
                }

                x = xf + signOrOne(rat) * std::max(std::abs(rat), tol1);
                fu = objective(x);
                ++num;

                if (fu <= fx) {
                    if (x >= xf) {
                        a = xf;
                    } else {
                        b = xf;
                    }
                    fulc = nfc;
                    ffulc = fnfc;
                    nfc = xf;
                    fnfc = fx;
                    xf = x;
                    fx = fu;
                } else {
                    if (x < xf) {
                        a = x;
                    } else {
                        b = x;
                    }
                    if ((fu <= fnfc) || (nfc == xf)) {
                        fulc = nfc;
                        ffulc = fnfc;
                        nfc = x;
                        fnfc = fu;
                    } else if ((fu <= ffulc) || (fulc == xf) || (fulc == nfc)) {
                        fulc = x;
                        ffulc = fu;
                    }
                }

                xm = 0.5 * (a + b);
                tol1 = sqrt_eps * std::abs(xf) + xatol / 3.0;
                tol2 = 2.0 * tol1;

                if (num >= params_.max_evaluations) {
                    term = TERMINATE_MAX_EVALUATIONS;
                    break;
                }
            }

            if (std::isnan(xf) || std::isnan(fx) || std::isnan(fu)) {
                term = TERMINATE_NAN_ENCOUNTERED;
            }

            Result result;
            result.lambda = xf;
            result.epsilon = fx;
            result.evaluations = num;
            result.termination = term;
            result.converged = (term == TERMINATE_CONVERGED_BRACKET);

            if (params_.verbose && params_.log_stream) {
                *params_.log_stream << "[BoundedScalarSolver::minimize] Termination Cause: " << term
                                    << ", lambda: " << result.lambda
                                    << ", value: " << result.epsilon
                                    << ", evaluations: " << result.evaluations << std::endl;
            }
            return result;
        }

        // -----------------------------------------------------------------------------
        // optimize
        // -----------------------------------------------------------------------------

        BoundedScalarSolver::Result BoundedScalarSolver::optimize(const traj::Trajectory& trajectory,
                                                                  const Bounds& bounds,
                                                                  bool doubled) const {
            common::Timer timer;
            const Result result = minimize(
                [&trajectory, doubled](double lambda) {
                    return problem::returnError(trajectory, lambda, doubled);
                },
                bounds);

            if (params_.verbose && params_.log_stream) {
                *params_.log_stream << "[BoundedScalarSolver::optimize] Total Optimization Time: "
                                    << timer.milliseconds() << " ms" << std::endl;
            }
            return result;
        }

        // -----------------------------------------------------------------------------
        // operator<<
        // -----------------------------------------------------------------------------

        std::ostream& operator<<(std::ostream& out, const BoundedScalarSolver::Termination& T) {
            static const char* messages[] = {
                "NOT YET TERMINATED", "CONVERGED BRACKET", "MAX EVALUATIONS", "NAN ENCOUNTERED"
            };
            out << messages[T];
            return out;
        }

    }  // namespace solver
}  // namespace regen
