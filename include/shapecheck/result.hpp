/**
 * @file result.hpp
 * @brief Outcome of a decode: a typed value or a DecodeError.
 */

#ifndef SHAPECHECK_RESULT_HPP
#define SHAPECHECK_RESULT_HPP

#include <utility>
#include <variant>

#include "decode_error.hpp"
#include "error.hpp"

namespace shapecheck {

/**
 * @brief Success(value) or Failure(error), never both.
 *
 * @tparam A Decoded value type
 */
template <typename A> class Result {
public:
    using value_type = A;

    /**
     * @brief Successful result holding value.
     */
    static Result success(A value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Failed result holding error.
     */
    static Result failure(DecodeError error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool ok() const noexcept {
        return state_.index() == 0;
    }

    explicit operator bool() const noexcept {
        return ok();
    }

    /**
     * @brief Decoded value.
     * @throws BadResultAccessException on a failure
     */
    [[nodiscard]] const A& value() const& {
        if (!ok()) {
            throw BadResultAccessException("value() called on a failed decode result");
        }
        return std::get<0>(state_);
    }

    [[nodiscard]] A&& value() && {
        if (!ok()) {
            throw BadResultAccessException("value() called on a failed decode result");
        }
        return std::get<0>(std::move(state_));
    }

    /**
     * @brief Failure description.
     * @throws BadResultAccessException on a success
     */
    [[nodiscard]] const DecodeError& error() const& {
        if (ok()) {
            throw BadResultAccessException("error() called on a successful decode result");
        }
        return std::get<1>(state_);
    }

    [[nodiscard]] DecodeError&& error() && {
        if (ok()) {
            throw BadResultAccessException("error() called on a successful decode result");
        }
        return std::get<1>(std::move(state_));
    }

    /**
     * @brief Decoded value, or fallback on a failure.
     */
    [[nodiscard]] A value_or(A fallback) const& {
        return ok() ? std::get<0>(state_) : std::move(fallback);
    }

private:
    template <std::size_t I, typename T>
    Result(std::in_place_index_t<I> tag, T&& payload) : state_(tag, std::forward<T>(payload)) {}

    std::variant<A, DecodeError> state_;
};

} // namespace shapecheck

#endif // SHAPECHECK_RESULT_HPP
