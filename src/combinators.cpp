/**
 * @file combinators.cpp
 * @brief Value-assembling combinators: type, partial, intersection, sum.
 *
 * The generic combinators (record, array, tuple, union_, lazy) are templates
 * and live in combinators.hpp.
 */

#include <shapecheck/combinators.hpp>

#include <unordered_set>

namespace shapecheck {

namespace {

enum class Presence { Required, Optional };

void require_unique_keys(const Fields& fields, const char* combinator) {
    std::unordered_set<std::string> seen;
    for (const auto& field : fields) {
        if (!seen.insert(field.key()).second) {
            throw InvalidArgumentException(std::string(combinator) + "() declares key " +
                                           quote(field.key()) + " more than once");
        }
    }
}

Decoder<Value> record_shape(Fields fields, Presence presence, const char* label) {
    require_unique_keys(fields, label);

    return Decoder<Value>([fields = std::move(fields), presence, label](const Value& input) {
        if (auto error = detail::check_record(input)) {
            return Result<Value>::failure(std::move(*error));
        }

        Value out = Value::object();
        DecodeError::LabeledErrors errors;
        for (const auto& field : fields) {
            const Value& member = field_of(input, field.key());
            if (presence == Presence::Optional && is_undefined(member)) {
                continue;
            }

            auto result = field.decoder().decode(member);
            if (!result) {
                errors.emplace_back(field.key(), std::move(result).error());
            } else if (!is_undefined(result.value())) {
                out[field.key()] = std::move(result).value();
            }
        }

        if (!errors.empty()) {
            return Result<Value>::failure(DecodeError::labeled(label, input, std::move(errors)));
        }
        return Result<Value>::success(std::move(out));
    });
}

} // namespace

Decoder<Value> type(Fields fields) {
    return record_shape(std::move(fields), Presence::Required, "type");
}

Decoder<Value> partial(Fields fields) {
    return record_shape(std::move(fields), Presence::Optional, "partial");
}

Decoder<Value> intersection(std::vector<Decoder<Value>> members) {
    return Decoder<Value>([members = std::move(members)](const Value& input) {
        if (members.empty()) {
            return Result<Value>::success(input);
        }

        std::vector<Value> values;
        values.reserve(members.size());
        std::vector<DecodeError> errors;
        for (const auto& member : members) {
            auto result = member.decode(input);
            if (result) {
                values.push_back(std::move(result).value());
            } else {
                errors.push_back(std::move(result).error());
            }
        }

        if (!errors.empty()) {
            return Result<Value>::failure(DecodeError::and_("intersection", input, std::move(errors)));
        }

        for (const auto& value : values) {
            if (!is_record(value)) {
                // Non-record members are not merged field by field
                return Result<Value>::success(std::move(values.back()));
            }
        }

        Value merged = Value::object();
        for (auto& value : values) {
            for (auto& [key, member] : value.items()) {
                merged[key] = std::move(member);
            }
        }
        return Result<Value>::success(std::move(merged));
    });
}

Decoder<Value> sum(std::string tag, Fields members) {
    if (members.empty()) {
        return never();
    }
    require_unique_keys(members, "sum");

    std::string expected;
    for (const auto& member : members) {
        if (!expected.empty()) {
            expected += ALTERNATIVE_SEPARATOR;
        }
        expected += quote(member.key());
    }

    return Decoder<Value>([tag = std::move(tag), members = std::move(members),
                           expected = std::move(expected)](const Value& input) -> Result<Value> {
        if (auto error = detail::check_record(input)) {
            return Result<Value>::failure(std::move(*error));
        }

        const Value& discriminant = field_of(input, tag);
        if (discriminant.is_string()) {
            const auto& name = discriminant.get_ref<const std::string&>();
            for (const auto& member : members) {
                if (member.key() != name) {
                    continue;
                }
                auto result = member.decoder().decode(input);
                if (!result) {
                    return result;
                }
                Value out = std::move(result).value();
                if (is_record(out)) {
                    out[tag] = discriminant;
                }
                return Result<Value>::success(std::move(out));
            }
        }

        DecodeError::LabeledErrors errors;
        errors.emplace_back(tag, DecodeError::leaf(expected, discriminant));
        return Result<Value>::failure(DecodeError::labeled("sum", input, std::move(errors)));
    });
}

} // namespace shapecheck
