#pragma once

#include <chrono>

namespace regen {
    namespace common {

        // -----------------------------------------------------------------------------
        /**
         * @class Timer
         * @brief Monotonic wall-clock stopwatch used for verbose service timing.
         */
        class Timer {
            public:
                using Clock = std::chrono::steady_clock;

                // -----------------------------------------------------------------------------
                /** @brief Starts the timer. */
                Timer() : start_(Clock::now()) {}

                // -----------------------------------------------------------------------------
                /** @brief Restarts counting from zero. */
                void reset() { start_ = Clock::now(); }

                // -----------------------------------------------------------------------------
                /** @brief Elapsed time in seconds since construction or the last reset. */
                [[nodiscard]] double seconds() const {
                    return std::chrono::duration<double>(Clock::now() - start_).count();
                }

                // -----------------------------------------------------------------------------
                /** @brief Elapsed time in milliseconds since construction or the last reset. */
                [[nodiscard]] double milliseconds() const {
                    return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
                }

            private:
                Clock::time_point start_;
        };

    }  // namespace common
}  // namespace regen
