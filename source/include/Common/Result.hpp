#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

#include "Common/Error.hpp"

namespace regen {

    // -----------------------------------------------------------------------------
    /**
     * @class Result
     * @brief Either a constructed value or the Error that prevented its construction.
     *
     * Returned by the fail-fast factories (`Pose::Create`, `Trajectory::Create`,
     * `se3::scale`, the trajectory encoders). `value()` rethrows the stored Error
     * when called on a failed result.
     */
    template <typename T>
    class Result {
        public:
            Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
            Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

            // -----------------------------------------------------------------------------
            [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
            explicit operator bool() const noexcept { return ok(); }

            // -----------------------------------------------------------------------------
            /** @brief Returns the value, or throws the stored Error. */
            const T& value() const& {
                if (!ok()) throw std::get<1>(data_);
                return std::get<0>(data_);
            }

            T&& value() && {
                if (!ok()) throw std::get<1>(data_);
                return std::get<0>(std::move(data_));
            }

            // -----------------------------------------------------------------------------
            /** @brief Returns the stored Error. Must only be called on a failed result. */
            const Error& error() const {
                if (ok()) {
                    throw std::logic_error("[Result::error] Result holds a value.");
                }
                return std::get<1>(data_);
            }

        private:
            std::variant<T, Error> data_;
    };

}  // namespace regen
