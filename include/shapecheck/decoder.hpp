/**
 * @file decoder.hpp
 * @brief Decoder handle, primitive decoders and refinement.
 *
 * A Decoder<A> validates an untyped Value and on success produces an A.
 * Primitive decoders re-type their input without coercion:
 * - string()         - std::string, expected "string"
 * - number()         - double, expected "number"
 * - boolean()        - bool, expected "boolean"
 * - integer()        - std::int64_t, a refinement of number(), expected "Int"
 * - unknown_array()  - Value, expected "Array<unknown>"
 * - unknown_record() - Value, expected "Record<string, unknown>"
 * - never()          - rejects everything, expected "never"
 */

#ifndef SHAPECHECK_DECODER_HPP
#define SHAPECHECK_DECODER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "decode_error.hpp"
#include "error.hpp"
#include "result.hpp"
#include "value.hpp"

namespace shapecheck {

/**
 * @brief Immutable validating function from Value to Result<A>.
 *
 * Copies share the same underlying function, so a decoder can be passed
 * around and stored by value. decode() has no side effects and may be called
 * concurrently.
 *
 * @tparam A Decoded value type
 */
template <typename A> class Decoder {
public:
    using value_type = A;
    using function_type = std::function<Result<A>(const Value&)>;

    /**
     * @brief Wrap a decoding function.
     *
     * @param fn Function from input to result
     * @throws InvalidArgumentException if fn is empty
     */
    explicit Decoder(function_type fn) {
        if (!fn) {
            throw InvalidArgumentException("Decoder requires a decoding function");
        }
        fn_ = std::make_shared<const function_type>(std::move(fn));
    }

    /**
     * @brief Validate input.
     *
     * @param input Raw value, left unmodified
     * @return Success with the decoded value, or Failure describing every mismatch
     */
    [[nodiscard]] Result<A> decode(const Value& input) const {
        return (*fn_)(input);
    }

private:
    std::shared_ptr<const function_type> fn_;
};

/// Decoded type of a decoder (TypeOf)
template <typename D> using decoded_t = typename D::value_type;

namespace detail {

/// Labels shared by the container primitives and the structural combinators
inline constexpr const char* UNKNOWN_ARRAY_LABEL = "Array<unknown>";
inline constexpr const char* UNKNOWN_RECORD_LABEL = "Record<string, unknown>";

/**
 * @brief Failure unknown_record() reports for input, or nothing for a record.
 */
std::optional<DecodeError> check_record(const Value& input);

/**
 * @brief Failure unknown_array() reports for input, or nothing for an array.
 */
std::optional<DecodeError> check_array(const Value& input);

} // namespace detail

/**
 * @brief Build a decoder from a type test.
 *
 * The input is passed through unchanged when is(input) holds, converted to A
 * with Value::get<A>(); otherwise the result is Leaf(expected, input).
 *
 * @tparam A Decoded type, Value by default
 * @param is Predicate over the raw input
 * @param expected Label reported on failure
 */
template <typename A = Value, typename Predicate>
Decoder<A> from_predicate(Predicate is, std::string expected) {
    return Decoder<A>([is = std::move(is), expected = std::move(expected)](const Value& input) {
        if (!is(input)) {
            return Result<A>::failure(DecodeError::leaf(expected, input));
        }
        if constexpr (std::is_same_v<A, Value>) {
            return Result<A>::success(input);
        } else {
            return Result<A>::success(input.template get<A>());
        }
    });
}

/**
 * @brief Decoder that accepts nothing.
 */
template <typename A = Value> Decoder<A> never() {
    return Decoder<A>([](const Value& input) {
        return Result<A>::failure(DecodeError::leaf("never", input));
    });
}

Decoder<std::string> string();
Decoder<double> number();
Decoder<bool> boolean();

/**
 * @brief Whole numbers, labelled "Int" on failure.
 *
 * Integer inputs are checked and converted exactly. Whole numbers outside
 * [-2^63, 2^63) have no std::int64_t form and fail like fractions, reporting
 * the input number unchanged.
 */
Decoder<std::int64_t> integer();

Decoder<Value> unknown_array();
Decoder<Value> unknown_record();

/**
 * @brief Narrow a decoder with an extra predicate.
 *
 * A failure of base is propagated unchanged. A decoded value b for which
 * predicate(b) is false fails with Leaf(expected, b): the decoded value, not
 * the raw input, is reported.
 *
 * @tparam A Decoded type, must be convertible to Value
 */
template <typename A, typename Predicate>
Decoder<A> refinement(Decoder<A> base, Predicate predicate, std::string expected) {
    return Decoder<A>([base = std::move(base), predicate = std::move(predicate),
                       expected = std::move(expected)](const Value& input) -> Result<A> {
        auto result = base.decode(input);
        if (!result) {
            return result;
        }
        if (!predicate(result.value())) {
            return Result<A>::failure(DecodeError::leaf(expected, Value(result.value())));
        }
        return result;
    });
}

/**
 * @brief View a typed decoder as a Decoder<Value>.
 *
 * Record shapes, intersections and sums assemble Values, so their members
 * are widened first. A must be convertible to Value.
 */
template <typename A> Decoder<Value> as_value(Decoder<A> decoder) {
    if constexpr (std::is_same_v<A, Value>) {
        return decoder;
    } else {
        return Decoder<Value>([decoder = std::move(decoder)](const Value& input) {
            auto result = decoder.decode(input);
            if (!result) {
                return Result<Value>::failure(std::move(result).error());
            }
            return Result<Value>::success(Value(std::move(result).value()));
        });
    }
}

/**
 * @brief Accept one of a fixed set of primitive literals.
 *
 * Matching is by value (1 and 1.0 are the same literal). On failure the
 * expected label lists every literal in JSON form separated by " | ".
 *
 * @param values Allowed strings, numbers, booleans or nulls
 * @throws InvalidArgumentException if values is empty or holds a non-literal
 */
Decoder<Value> literals(std::vector<Value> values);

} // namespace shapecheck

#endif // SHAPECHECK_DECODER_HPP
