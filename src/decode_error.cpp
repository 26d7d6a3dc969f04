/**
 * @file decode_error.cpp
 * @brief DecodeError construction.
 */

#include <shapecheck/decode_error.hpp>

namespace shapecheck {

namespace {

void require_children(bool empty, ErrorKind kind) {
    if (empty) {
        throw InvalidArgumentException(std::string(kind_name(kind)) +
                                       " error requires at least one child error");
    }
}

} // namespace

const char* kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Leaf:
        return "Leaf";
    case ErrorKind::Indexed:
        return "Indexed";
    case ErrorKind::Labeled:
        return "Labeled";
    case ErrorKind::And:
        return "And";
    case ErrorKind::Or:
        return "Or";
    default:
        return "Unknown";
    }
}

DecodeError::DecodeError(ErrorKind kind, std::string expected, Value actual,
                         std::vector<Entry> errors)
    : kind_(kind), expected_(std::move(expected)), actual_(std::move(actual)),
      errors_(std::move(errors)) {}

DecodeError::DecodeError(const DecodeError& other) = default;
DecodeError::DecodeError(DecodeError&& other) noexcept = default;
DecodeError& DecodeError::operator=(const DecodeError& other) = default;
DecodeError& DecodeError::operator=(DecodeError&& other) noexcept = default;
DecodeError::~DecodeError() = default;

DecodeError DecodeError::leaf(std::string expected, Value actual) {
    return DecodeError(ErrorKind::Leaf, std::move(expected), std::move(actual), {});
}

DecodeError DecodeError::indexed(std::string expected, Value actual, IndexedErrors errors) {
    require_children(errors.empty(), ErrorKind::Indexed);

    std::vector<Entry> entries;
    entries.reserve(errors.size());
    for (auto& [index, error] : errors) {
        entries.push_back(Entry{index, {}, std::move(error)});
    }
    return DecodeError(ErrorKind::Indexed, std::move(expected), std::move(actual),
                       std::move(entries));
}

DecodeError DecodeError::labeled(std::string expected, Value actual, LabeledErrors errors) {
    require_children(errors.empty(), ErrorKind::Labeled);

    std::vector<Entry> entries;
    entries.reserve(errors.size());
    for (auto& [key, error] : errors) {
        entries.push_back(Entry{0, std::move(key), std::move(error)});
    }
    return DecodeError(ErrorKind::Labeled, std::move(expected), std::move(actual),
                       std::move(entries));
}

DecodeError DecodeError::and_(std::string expected, Value actual, std::vector<DecodeError> errors) {
    require_children(errors.empty(), ErrorKind::And);

    std::vector<Entry> entries;
    entries.reserve(errors.size());
    for (auto& error : errors) {
        entries.push_back(Entry{0, {}, std::move(error)});
    }
    return DecodeError(ErrorKind::And, std::move(expected), std::move(actual), std::move(entries));
}

DecodeError DecodeError::or_(std::string expected, Value actual, std::vector<DecodeError> errors) {
    require_children(errors.empty(), ErrorKind::Or);

    std::vector<Entry> entries;
    entries.reserve(errors.size());
    for (auto& error : errors) {
        entries.push_back(Entry{0, {}, std::move(error)});
    }
    return DecodeError(ErrorKind::Or, std::move(expected), std::move(actual), std::move(entries));
}

DecodeError DecodeError::with_expected(std::string expected) const {
    DecodeError copy(*this);
    copy.expected_ = std::move(expected);
    return copy;
}

} // namespace shapecheck
