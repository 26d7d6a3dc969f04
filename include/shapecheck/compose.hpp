/**
 * @file compose.hpp
 * @brief Sequencing and alternative operators over decoders.
 *
 * Everything here is defined directly against Result:
 * - map / map_error / with_expected transform one side of a result
 * - of / ap / ap_first / ap_second run decoders on the same input and
 *   stop at the first failure (no accumulation, unlike the combinators)
 * - alt / zero provide a fallback on failure
 */

#ifndef SHAPECHECK_COMPOSE_HPP
#define SHAPECHECK_COMPOSE_HPP

#include <string>
#include <type_traits>
#include <utility>

#include "decode_error.hpp"
#include "decoder.hpp"
#include "result.hpp"
#include "value.hpp"

namespace shapecheck {

/**
 * @brief Transform the decoded value; failures pass through unchanged.
 */
template <typename A, typename F, typename B = std::invoke_result_t<const F&, A>>
Decoder<B> map(Decoder<A> decoder, F f) {
    return Decoder<B>([decoder = std::move(decoder), f = std::move(f)](const Value& input) {
        auto result = decoder.decode(input);
        if (!result) {
            return Result<B>::failure(std::move(result).error());
        }
        return Result<B>::success(f(std::move(result).value()));
    });
}

/**
 * @brief Transform the error of a failure; successes pass through unchanged.
 */
template <typename A, typename F> Decoder<A> map_error(Decoder<A> decoder, F f) {
    return Decoder<A>([decoder = std::move(decoder), f = std::move(f)](const Value& input) {
        auto result = decoder.decode(input);
        if (result) {
            return result;
        }
        return Result<A>::failure(f(std::move(result).error()));
    });
}

/**
 * @brief Replace the expected label of the top-level error.
 */
template <typename A> Decoder<A> with_expected(Decoder<A> decoder, std::string expected) {
    return map_error(std::move(decoder), [expected = std::move(expected)](const DecodeError& e) {
        return e.with_expected(expected);
    });
}

/**
 * @brief Decoder that ignores its input and always succeeds with value.
 */
template <typename A> Decoder<A> of(A value) {
    return Decoder<A>([value = std::move(value)](const Value&) { return Result<A>::success(value); });
}

/**
 * @brief Apply a decoded function to a decoded argument.
 *
 * Both decoders read the same input. The first failure (fab before fa) is
 * returned.
 */
template <typename F, typename A, typename B = std::invoke_result_t<const F&, A>>
Decoder<B> ap(Decoder<F> fab, Decoder<A> fa) {
    return Decoder<B>([fab = std::move(fab), fa = std::move(fa)](const Value& input) {
        auto function = fab.decode(input);
        auto argument = fa.decode(input);
        if (!function) {
            return Result<B>::failure(std::move(function).error());
        }
        if (!argument) {
            return Result<B>::failure(std::move(argument).error());
        }
        return Result<B>::success(function.value()(std::move(argument).value()));
    });
}

/**
 * @brief Run both decoders, keep the first value.
 */
template <typename A, typename B> Decoder<A> ap_first(Decoder<A> fa, Decoder<B> fb) {
    return Decoder<A>([fa = std::move(fa), fb = std::move(fb)](const Value& input) {
        auto first = fa.decode(input);
        auto second = fb.decode(input);
        if (!first) {
            return first;
        }
        if (!second) {
            return Result<A>::failure(std::move(second).error());
        }
        return first;
    });
}

/**
 * @brief Run both decoders, keep the second value.
 */
template <typename A, typename B> Decoder<B> ap_second(Decoder<A> fa, Decoder<B> fb) {
    return Decoder<B>([fa = std::move(fa), fb = std::move(fb)](const Value& input) {
        auto first = fa.decode(input);
        auto second = fb.decode(input);
        if (!first) {
            return Result<B>::failure(std::move(first).error());
        }
        return second;
    });
}

/**
 * @brief Fall back to another decoder when primary fails.
 *
 * The supplier is called only after a failure of primary, and the fallback's
 * result (success or failure) is returned as is.
 *
 * @param primary Decoder tried first
 * @param fallback Callable returning a Decoder<A>
 */
template <typename A, typename F> Decoder<A> alt(Decoder<A> primary, F fallback) {
    static_assert(std::is_same_v<std::invoke_result_t<const F&>, Decoder<A>>,
                  "alt fallback must return a decoder of the same type");
    return Decoder<A>([primary = std::move(primary), fallback = std::move(fallback)](const Value& input) {
        auto result = primary.decode(input);
        if (result) {
            return result;
        }
        return fallback().decode(input);
    });
}

/**
 * @brief Identity of alt: rejects everything.
 */
template <typename A = Value> Decoder<A> zero() {
    return never<A>();
}

} // namespace shapecheck

#endif // SHAPECHECK_COMPOSE_HPP
