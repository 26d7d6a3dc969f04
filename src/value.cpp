/**
 * @file value.cpp
 * @brief Value access and JSON.stringify-compatible rendering.
 */

#include <shapecheck/value.hpp>

#include <cmath>
#include <cstddef>
#include <string>

namespace shapecheck {

namespace {

const Value& missing() {
    static const Value instance = undefined();
    return instance;
}

std::string dump_scalar(const Value& value) {
    return value.dump(-1, ' ', false, nlohmann::detail::error_handler_t::replace);
}

/**
 * @brief Format a double the way JavaScript's Number toString does.
 *
 * nlohmann prints the shortest digits that round-trip; only the layout is
 * changed here: plain digits up to 1e21, "0.000ddd" down to 1e-6, and an
 * unpadded exponent ("1e-7", "1.5e+300") outside that window.
 */
std::string stringify_number(double number) {
    if (!std::isfinite(number)) {
        return "null";
    }
    if (number == 0.0) {
        // Negative zero prints as 0
        return "0";
    }

    std::string text = dump_scalar(Value(number));
    std::string out;
    if (text.front() == '-') {
        out = "-";
        text.erase(0, 1);
    }

    int exponent = 0;
    const auto e = text.find_first_of("eE");
    if (e != std::string::npos) {
        exponent = std::stoi(text.substr(e + 1));
        text.resize(e);
    }

    // number == 0.<digits> * 10^point
    const auto dot = text.find('.');
    const std::string whole = text.substr(0, dot);
    std::string digits = whole + (dot == std::string::npos ? "" : text.substr(dot + 1));
    int point = static_cast<int>(whole.size()) + exponent;

    const auto lead = digits.find_first_not_of('0');
    digits.erase(0, lead);
    point -= static_cast<int>(lead);
    digits.erase(digits.find_last_not_of('0') + 1);

    const int k = static_cast<int>(digits.size());
    if (k <= point && point <= 21) {
        out += digits;
        out.append(static_cast<std::size_t>(point - k), '0');
    } else if (0 < point && point <= 21) {
        out += digits.substr(0, static_cast<std::size_t>(point));
        out += '.';
        out += digits.substr(static_cast<std::size_t>(point));
    } else if (-6 < point && point <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-point), '0');
        out += digits;
    } else {
        const int power = point - 1;
        out += digits[0];
        if (k > 1) {
            out += '.';
            out += digits.substr(1);
        }
        out += power < 0 ? "e-" : "e+";
        out += std::to_string(power < 0 ? -power : power);
    }
    return out;
}

} // namespace

const Value& field_of(const Value& record, const std::string& key) {
    if (!record.is_object()) {
        return missing();
    }
    auto it = record.find(key);
    if (it == record.end()) {
        return missing();
    }
    return *it;
}

const Value& element_of(const Value& array, std::size_t index) {
    if (!array.is_array() || index >= array.size()) {
        return missing();
    }
    return array[index];
}

std::string stringify(const Value& value) {
    switch (value.type()) {
    case Value::value_t::discarded:
        return "undefined";
    case Value::value_t::number_float:
        return stringify_number(value.get<double>());
    case Value::value_t::array: {
        std::string out = "[";
        bool first = true;
        for (const auto& element : value) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += element.is_discarded() ? "null" : stringify(element);
        }
        out += ']';
        return out;
    }
    case Value::value_t::object: {
        std::string out = "{";
        bool first = true;
        for (const auto& [key, member] : value.items()) {
            if (member.is_discarded()) {
                continue;
            }
            if (!first) {
                out += ',';
            }
            first = false;
            out += quote(key);
            out += ':';
            out += stringify(member);
        }
        out += '}';
        return out;
    }
    default:
        return dump_scalar(value);
    }
}

std::string quote(std::string_view text) {
    return dump_scalar(Value(std::string(text)));
}

Value parse(std::string_view text) {
    try {
        return Value::parse(text.begin(), text.end());
    } catch (const Value::parse_error& e) {
        throw InvalidDataException(e.what());
    }
}

} // namespace shapecheck
