/**
 * @file combinators.hpp
 * @brief Structural decoders built from member decoders.
 *
 * Container combinators check the container shape first and propagate that
 * failure unchanged. Past the shape check they decode every member, even
 * after a failure, and report all failing members in one composite error:
 * - type / partial / record - Labeled("type" | "partial" | "record", ...)
 * - array / tuple           - Indexed("array" | "tuple", ...)
 * - intersection            - And("intersection", ...)
 * - union_                  - Or("union", ...), stops at the first success
 * - sum                     - Labeled("sum", ...) on an unknown discriminant
 */

#ifndef SHAPECHECK_COMBINATORS_HPP
#define SHAPECHECK_COMBINATORS_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "decode_error.hpp"
#include "decoder.hpp"
#include "result.hpp"
#include "value.hpp"

namespace shapecheck {

/**
 * @brief Named member of a record shape or a tagged sum.
 *
 * Converts from any Decoder<A> whose A is convertible to Value, so shapes
 * are declared as brace lists: type({{"name", string()}, {"age", number()}}).
 */
class Field {
public:
    template <typename A>
    Field(std::string key, Decoder<A> decoder)
        : key_(std::move(key)), decoder_(as_value(std::move(decoder))) {}

    [[nodiscard]] const std::string& key() const noexcept {
        return key_;
    }

    [[nodiscard]] const Decoder<Value>& decoder() const noexcept {
        return decoder_;
    }

private:
    std::string key_;
    Decoder<Value> decoder_;
};

using Fields = std::vector<Field>;

/**
 * @brief Record with required fields.
 *
 * Every declared field is decoded, in declaration order; an absent key is
 * decoded as undefined(). The result holds exactly the declared keys.
 *
 * @throws InvalidArgumentException if a key is declared twice
 */
Decoder<Value> type(Fields fields);

/**
 * @brief Record with optional fields.
 *
 * Fields whose value is undefined() are skipped and left out of the result.
 *
 * @throws InvalidArgumentException if a key is declared twice
 */
Decoder<Value> partial(Fields fields);

/**
 * @brief Run every member against the same input.
 *
 * If all members succeed and all results are records, the result is their
 * shallow union, later members winning on shared keys. If any result is not
 * a record, the last member's result is returned. With no members the input
 * is returned unchanged.
 */
Decoder<Value> intersection(std::vector<Decoder<Value>> members);

/**
 * @brief Tagged sum selected by a string discriminant field.
 *
 * The member named by input[tag] decodes the whole input and the tag is
 * written back into a record result. An absent, non-string or unknown tag
 * fails with Labeled("sum", input, [(tag, Leaf(keys, input[tag]))]) where
 * keys are the member names in JSON form separated by " | ".
 *
 * @param tag Discriminant field name
 * @param members Member decoders keyed by discriminant value
 * @throws InvalidArgumentException if a member name is declared twice
 */
Decoder<Value> sum(std::string tag, Fields members);

/**
 * @brief Homogeneous dictionary.
 *
 * Every key of the input is decoded, in the input's own key order.
 */
template <typename A> Decoder<std::map<std::string, A>> record(Decoder<A> decoder) {
    using Output = std::map<std::string, A>;
    return Decoder<Output>([decoder = std::move(decoder)](const Value& input) {
        if (auto error = detail::check_record(input)) {
            return Result<Output>::failure(std::move(*error));
        }

        Output out;
        DecodeError::LabeledErrors errors;
        for (const auto& [key, member] : input.items()) {
            auto result = decoder.decode(member);
            if (result) {
                out.emplace(key, std::move(result).value());
            } else {
                errors.emplace_back(key, std::move(result).error());
            }
        }

        if (!errors.empty()) {
            return Result<Output>::failure(DecodeError::labeled("record", input, std::move(errors)));
        }
        return Result<Output>::success(std::move(out));
    });
}

/**
 * @brief Homogeneous sequence; the result has the input's length.
 */
template <typename A> Decoder<std::vector<A>> array(Decoder<A> decoder) {
    using Output = std::vector<A>;
    return Decoder<Output>([decoder = std::move(decoder)](const Value& input) {
        if (auto error = detail::check_array(input)) {
            return Result<Output>::failure(std::move(*error));
        }

        Output out;
        out.reserve(input.size());
        DecodeError::IndexedErrors errors;
        for (std::size_t i = 0; i < input.size(); ++i) {
            auto result = decoder.decode(input[i]);
            if (result) {
                out.push_back(std::move(result).value());
            } else {
                errors.emplace_back(i, std::move(result).error());
            }
        }

        if (!errors.empty()) {
            return Result<Output>::failure(DecodeError::indexed("array", input, std::move(errors)));
        }
        return Result<Output>::success(std::move(out));
    });
}

namespace detail {

template <typename... As, std::size_t... Is>
Result<std::tuple<As...>> decode_tuple(const std::tuple<Decoder<As>...>& decoders,
                                       const Value& input, std::index_sequence<Is...>) {
    using Output = std::tuple<As...>;
    if (auto error = check_array(input)) {
        return Result<Output>::failure(std::move(*error));
    }

    std::tuple<std::optional<As>...> values;
    DecodeError::IndexedErrors errors;
    auto step = [&](auto position) {
        constexpr std::size_t I = decltype(position)::value;
        auto result = std::get<I>(decoders).decode(element_of(input, I));
        if (result) {
            std::get<I>(values).emplace(std::move(result).value());
        } else {
            errors.emplace_back(I, std::move(result).error());
        }
    };
    (step(std::integral_constant<std::size_t, Is>{}), ...);
    (void)step;

    if (!errors.empty()) {
        return Result<Output>::failure(DecodeError::indexed("tuple", input, std::move(errors)));
    }
    return Result<Output>::success(Output(std::move(*std::get<Is>(values))...));
}

} // namespace detail

/**
 * @brief Fixed-arity heterogeneous sequence.
 *
 * Position i is decoded by the i-th decoder (undefined() past the end of the
 * input); extra trailing elements are ignored.
 */
template <typename... As> Decoder<std::tuple<As...>> tuple(Decoder<As>... decoders) {
    return Decoder<std::tuple<As...>>(
        [decoders = std::make_tuple(std::move(decoders)...)](const Value& input) {
            return detail::decode_tuple(decoders, input, std::index_sequence_for<As...>{});
        });
}

/**
 * @brief First member that succeeds, in declaration order.
 *
 * Members after the first success are not run. With no members the union
 * rejects everything like never().
 */
template <typename A> Decoder<A> union_(std::vector<Decoder<A>> members) {
    if (members.empty()) {
        return never<A>();
    }
    return Decoder<A>([members = std::move(members)](const Value& input) -> Result<A> {
        std::vector<DecodeError> errors;
        for (const auto& member : members) {
            auto result = member.decode(input);
            if (result) {
                return result;
            }
            errors.push_back(std::move(result).error());
        }
        return Result<A>::failure(DecodeError::or_("union", input, std::move(errors)));
    });
}

template <typename A, typename... Rest> Decoder<A> union_(Decoder<A> first, Rest... rest) {
    static_assert((std::is_same_v<Rest, Decoder<A>> && ...),
                  "union_ members must share one decoded type");
    return union_(std::vector<Decoder<A>>{std::move(first), std::move(rest)...});
}

/**
 * @brief Literals, or else decoder.
 */
template <typename A> Decoder<Value> literals_or(std::vector<Value> values, Decoder<A> decoder) {
    return union_(literals(std::move(values)), as_value(std::move(decoder)));
}

/**
 * @brief Defer building a decoder until it is first used.
 *
 * Breaks construction-time recursion for self-referential shapes. The
 * supplier runs once, on the first decode(); the decoder it returns is cached
 * and reused by every later and re-entrant call. With
 * SHAPECHECK_LAZY_SYNCHRONIZED the first use is guarded by std::call_once.
 *
 * @param supplier Callable returning a Decoder<A>
 */
template <typename F, typename D = std::invoke_result_t<F&>> D lazy(F supplier) {
    using A = decoded_t<D>;

    struct Cell {
        F supplier;
        std::optional<D> decoder;
#if SHAPECHECK_LAZY_SYNCHRONIZED
        std::once_flag once;
#endif

        explicit Cell(F fn) : supplier(std::move(fn)) {}

        const D& get() {
#if SHAPECHECK_LAZY_SYNCHRONIZED
            std::call_once(once, [this] { decoder.emplace(supplier()); });
#else
            if (!decoder) {
                decoder.emplace(supplier());
            }
#endif
            return *decoder;
        }
    };

    auto cell = std::make_shared<Cell>(std::move(supplier));
    return D([cell](const Value& input) -> Result<A> { return cell->get().decode(input); });
}

} // namespace shapecheck

#endif // SHAPECHECK_COMBINATORS_HPP
