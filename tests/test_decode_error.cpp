/**
 * @file test_decode_error.cpp
 * @brief Unit tests for DecodeError construction.
 */

#include <shapecheck/decode_error.hpp>

#include <catch2/catch.hpp>

#include <cstring>

using namespace shapecheck;

TEST_CASE("Leaf holds expected and actual", "[decode_error]") {
    auto error = DecodeError::leaf("string", Value(1));

    REQUIRE(error.kind() == ErrorKind::Leaf);
    REQUIRE(error.expected() == "string");
    REQUIRE(error.actual() == Value(1));
    REQUIRE(error.errors().empty());
}

TEST_CASE("Indexed keeps positions in order", "[decode_error]") {
    DecodeError::IndexedErrors children;
    children.emplace_back(3, DecodeError::leaf("number", Value("x")));
    children.emplace_back(1, DecodeError::leaf("number", Value(true)));

    auto error = DecodeError::indexed("array", parse(R"([0, true, 2, "x"])"), std::move(children));

    REQUIRE(error.kind() == ErrorKind::Indexed);
    REQUIRE(error.errors().size() == 2);
    REQUIRE(error.errors()[0].index == 3);
    REQUIRE(error.errors()[0].error.actual() == Value("x"));
    REQUIRE(error.errors()[1].index == 1);
    REQUIRE(error.errors()[1].error.actual() == Value(true));
}

TEST_CASE("Labeled keeps keys in order", "[decode_error]") {
    DecodeError::LabeledErrors children;
    children.emplace_back("b", DecodeError::leaf("string", Value(1)));
    children.emplace_back("a", DecodeError::leaf("string", Value(2)));

    auto error = DecodeError::labeled("type", parse(R"({"a": 2, "b": 1})"), std::move(children));

    REQUIRE(error.kind() == ErrorKind::Labeled);
    REQUIRE(error.expected() == "type");
    REQUIRE(error.errors().size() == 2);
    REQUIRE(error.errors()[0].key == "b");
    REQUIRE(error.errors()[1].key == "a");
}

TEST_CASE("And and Or hold unlabeled children", "[decode_error]") {
    std::vector<DecodeError> children;
    children.push_back(DecodeError::leaf("string", Value(1)));
    children.push_back(DecodeError::leaf("boolean", Value(1)));

    auto conjunction = DecodeError::and_("intersection", Value(1), children);
    REQUIRE(conjunction.kind() == ErrorKind::And);
    REQUIRE(conjunction.errors().size() == 2);
    REQUIRE(conjunction.errors()[0].error.expected() == "string");
    REQUIRE(conjunction.errors()[1].error.expected() == "boolean");

    auto disjunction = DecodeError::or_("union", Value(1), children);
    REQUIRE(disjunction.kind() == ErrorKind::Or);
    REQUIRE(disjunction.errors().size() == 2);
}

TEST_CASE("composite errors require children", "[decode_error]") {
    REQUIRE_THROWS_AS(DecodeError::indexed("array", parse("[]"), {}), InvalidArgumentException);
    REQUIRE_THROWS_AS(DecodeError::labeled("type", parse("{}"), {}), InvalidArgumentException);
    REQUIRE_THROWS_AS(DecodeError::and_("intersection", Value(1), {}), InvalidArgumentException);
    REQUIRE_THROWS_AS(DecodeError::or_("union", Value(1), {}), InvalidArgumentException);
}

TEST_CASE("with_expected relabels the top node only", "[decode_error]") {
    DecodeError::LabeledErrors children;
    children.emplace_back("a", DecodeError::leaf("string", Value(1)));
    auto error = DecodeError::labeled("type", parse(R"({"a": 1})"), std::move(children));

    auto relabeled = error.with_expected("Person");
    REQUIRE(relabeled.expected() == "Person");
    REQUIRE(relabeled.kind() == ErrorKind::Labeled);
    REQUIRE(relabeled.errors()[0].error.expected() == "string");
    REQUIRE(error.expected() == "type");
}

TEST_CASE("errors are values", "[decode_error]") {
    auto original = DecodeError::leaf("number", parse(R"({"a": 1})"));
    DecodeError copy = original;

    REQUIRE(copy.expected() == original.expected());
    REQUIRE(copy.actual() == original.actual());

    DecodeError moved = std::move(copy);
    REQUIRE(moved.actual() == parse(R"({"a": 1})"));
}

TEST_CASE("kind names", "[decode_error]") {
    REQUIRE(std::strcmp(kind_name(ErrorKind::Leaf), "Leaf") == 0);
    REQUIRE(std::strcmp(kind_name(ErrorKind::Indexed), "Indexed") == 0);
    REQUIRE(std::strcmp(kind_name(ErrorKind::Labeled), "Labeled") == 0);
    REQUIRE(std::strcmp(kind_name(ErrorKind::And), "And") == 0);
    REQUIRE(std::strcmp(kind_name(ErrorKind::Or), "Or") == 0);
}
