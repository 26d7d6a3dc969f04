/**
 * @file value.hpp
 * @brief Raw input values examined by decoders.
 *
 * A Value is an insertion-ordered JSON document. Objects keep the key order
 * they were parsed or built with, which is the order record() walks them in.
 *
 * A missing field reads as undefined(), a Value in nlohmann's "discarded"
 * state. It never appears inside a parsed document, so it stands apart from
 * an explicit null.
 */

#ifndef SHAPECHECK_VALUE_HPP
#define SHAPECHECK_VALUE_HPP

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "error.hpp"

namespace shapecheck {

/// Untyped input value
using Value = nlohmann::ordered_json;

/**
 * @brief The value of an absent field or tuple position.
 */
inline Value undefined() {
    return Value(Value::value_t::discarded);
}

[[nodiscard]] inline bool is_undefined(const Value& value) noexcept {
    return value.is_discarded();
}

/**
 * @brief Plain key-value mapping test (the Record<string, unknown> shape).
 */
[[nodiscard]] inline bool is_record(const Value& value) noexcept {
    return value.is_object();
}

[[nodiscard]] inline bool is_array(const Value& value) noexcept {
    return value.is_array();
}

/**
 * @brief Primitive literal test: string, number, boolean or null.
 */
[[nodiscard]] inline bool is_literal(const Value& value) noexcept {
    return value.is_string() || value.is_number() || value.is_boolean() || value.is_null();
}

/**
 * @brief Read a field of a record.
 *
 * @param record Value to read from
 * @param key Field name
 * @return The field, or undefined() if the key is absent or record is not an object
 */
const Value& field_of(const Value& record, const std::string& key);

/**
 * @brief Read a position of an array.
 *
 * @return The element, or undefined() past the end or on a non-array
 */
const Value& element_of(const Value& array, std::size_t index);

/**
 * @brief Render a value the way JSON.stringify does.
 *
 * - undefined() renders as "undefined"
 * - integral numbers carry no fractional part, non-finite numbers render as null
 * - arrays and objects are compact; undefined members are dropped from
 *   objects and become null inside arrays
 */
std::string stringify(const Value& value);

/**
 * @brief JSON-quote a string ("a" -> "\"a\"").
 */
std::string quote(std::string_view text);

/**
 * @brief Parse JSON text into a Value.
 *
 * @throws InvalidDataException if the text is not valid JSON
 */
Value parse(std::string_view text);

} // namespace shapecheck

#endif // SHAPECHECK_VALUE_HPP
