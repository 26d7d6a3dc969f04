/**
 * @file decoder.cpp
 * @brief Primitive decoders and literals.
 *
 * The generic pieces (Decoder, from_predicate, refinement, as_value) live in
 * decoder.hpp. The primitives here are built once and handed out as copies
 * sharing the same function.
 */

#include <shapecheck/decoder.hpp>

#include <cmath>
#include <limits>

namespace shapecheck {

namespace detail {

std::optional<DecodeError> check_record(const Value& input) {
    if (is_record(input)) {
        return std::nullopt;
    }
    return DecodeError::leaf(UNKNOWN_RECORD_LABEL, input);
}

std::optional<DecodeError> check_array(const Value& input) {
    if (is_array(input)) {
        return std::nullopt;
    }
    return DecodeError::leaf(UNKNOWN_ARRAY_LABEL, input);
}

} // namespace detail

namespace {

/// The input as a 64-bit integer, or nothing if it is not a whole number in range
std::optional<std::int64_t> to_int64(const Value& n) {
    if (n.is_number_integer()) {
        if (n.is_number_unsigned() &&
            n.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return n.get<std::int64_t>();
    }

    const double d = n.get<double>();
    constexpr double lower = -9223372036854775808.0; // -2^63
    constexpr double upper = 9223372036854775808.0;  // 2^63
    if (!std::isfinite(d) || std::trunc(d) != d || d < lower || d >= upper) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(d);
}

} // namespace

Decoder<std::string> string() {
    static const Decoder<std::string> instance = from_predicate<std::string>(
        [](const Value& u) { return u.is_string(); }, "string");
    return instance;
}

Decoder<double> number() {
    static const Decoder<double> instance =
        from_predicate<double>([](const Value& u) { return u.is_number(); }, "number");
    return instance;
}

Decoder<bool> boolean() {
    static const Decoder<bool> instance =
        from_predicate<bool>([](const Value& u) { return u.is_boolean(); }, "boolean");
    return instance;
}

Decoder<std::int64_t> integer() {
    // Refines the raw number so integer inputs never pass through a double
    static const Decoder<std::int64_t> instance = [] {
        auto whole = refinement(
            from_predicate([](const Value& u) { return u.is_number(); }, "number"),
            [](const Value& n) { return to_int64(n).has_value(); }, "Int");
        return Decoder<std::int64_t>([whole](const Value& u) {
            auto result = whole.decode(u);
            if (!result) {
                return Result<std::int64_t>::failure(std::move(result).error());
            }
            return Result<std::int64_t>::success(*to_int64(result.value()));
        });
    }();
    return instance;
}

Decoder<Value> unknown_array() {
    static const Decoder<Value> instance = from_predicate(
        [](const Value& u) { return is_array(u); }, detail::UNKNOWN_ARRAY_LABEL);
    return instance;
}

Decoder<Value> unknown_record() {
    static const Decoder<Value> instance = from_predicate(
        [](const Value& u) { return is_record(u); }, detail::UNKNOWN_RECORD_LABEL);
    return instance;
}

Decoder<Value> literals(std::vector<Value> values) {
    if (values.empty()) {
        throw InvalidArgumentException("literals() requires at least one value");
    }

    std::string expected;
    for (const auto& value : values) {
        if (!is_literal(value)) {
            throw InvalidArgumentException("literals() accepts strings, numbers, booleans and null, got " +
                                           stringify(value));
        }
        if (!expected.empty()) {
            expected += ALTERNATIVE_SEPARATOR;
        }
        expected += stringify(value);
    }

    return from_predicate(
        [values = std::move(values)](const Value& u) {
            for (const auto& value : values) {
                if (u == value) {
                    return true;
                }
            }
            return false;
        },
        std::move(expected));
}

} // namespace shapecheck
