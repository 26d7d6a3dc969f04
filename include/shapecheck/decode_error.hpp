/**
 * @file decode_error.hpp
 * @brief Tagged tree describing why a value failed to decode.
 *
 * Every failure is one of five kinds:
 * - Leaf    - a single shape mismatch
 * - Indexed - failures at positions of an array or tuple
 * - Labeled - failures at named fields of a record
 * - And     - failed members of an intersection
 * - Or      - every failed alternative of a union
 *
 * Composite kinds always hold at least one child, in the order the members
 * were declared (or the input was walked).
 */

#ifndef SHAPECHECK_DECODE_ERROR_HPP
#define SHAPECHECK_DECODE_ERROR_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace shapecheck {

/**
 * @brief DecodeError variants.
 */
enum class ErrorKind { Leaf, Indexed, Labeled, And, Or };

/**
 * @brief Get the name of an error kind.
 * @param kind Error kind
 * @return "Leaf", "Indexed", "Labeled", "And" or "Or"
 */
const char* kind_name(ErrorKind kind) noexcept;

/**
 * @brief Immutable failure tree produced by a decoder.
 */
class DecodeError {
public:
    /// Child failure; index is set for Indexed parents, key for Labeled parents
    struct Entry;

    /// Positional children of an Indexed node
    using IndexedErrors = std::vector<std::pair<std::size_t, DecodeError>>;
    /// Keyed children of a Labeled node
    using LabeledErrors = std::vector<std::pair<std::string, DecodeError>>;

    /**
     * @brief Single mismatch at one input location.
     *
     * @param expected Label of the expected shape
     * @param actual Value that was examined
     */
    static DecodeError leaf(std::string expected, Value actual);

    /**
     * @throws InvalidArgumentException if errors is empty
     */
    static DecodeError indexed(std::string expected, Value actual, IndexedErrors errors);

    /**
     * @throws InvalidArgumentException if errors is empty
     */
    static DecodeError labeled(std::string expected, Value actual, LabeledErrors errors);

    /**
     * @brief Failed members of an intersection.
     * @throws InvalidArgumentException if errors is empty
     */
    static DecodeError and_(std::string expected, Value actual, std::vector<DecodeError> errors);

    /**
     * @brief Failed alternatives of a union.
     * @throws InvalidArgumentException if errors is empty
     */
    static DecodeError or_(std::string expected, Value actual, std::vector<DecodeError> errors);

    DecodeError(const DecodeError& other);
    DecodeError(DecodeError&& other) noexcept;
    DecodeError& operator=(const DecodeError& other);
    DecodeError& operator=(DecodeError&& other) noexcept;
    ~DecodeError();

    [[nodiscard]] ErrorKind kind() const noexcept {
        return kind_;
    }

    [[nodiscard]] const std::string& expected() const noexcept {
        return expected_;
    }

    [[nodiscard]] const Value& actual() const noexcept {
        return actual_;
    }

    /**
     * @brief Child failures, empty for a Leaf.
     */
    [[nodiscard]] const std::vector<Entry>& errors() const noexcept {
        return errors_;
    }

    /**
     * @brief Copy of this node with a different expected label.
     */
    [[nodiscard]] DecodeError with_expected(std::string expected) const;

private:
    DecodeError(ErrorKind kind, std::string expected, Value actual, std::vector<Entry> errors);

    ErrorKind kind_;
    std::string expected_;
    Value actual_;
    std::vector<Entry> errors_;
};

struct DecodeError::Entry {
    std::size_t index = 0;
    std::string key;
    DecodeError error;
};

} // namespace shapecheck

#endif // SHAPECHECK_DECODE_ERROR_HPP
