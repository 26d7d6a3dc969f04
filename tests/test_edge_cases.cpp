/**
 * @file test_edge_cases.cpp
 * @brief Cross-cutting properties and API misuse.
 */

#include <catch2/catch.hpp>
#include <shapecheck/shapecheck.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace shapecheck;

// ============================================================================
// Exhaustive accumulation
// ============================================================================

TEST_CASE("k invalid members give k children", "[edge][exhaustive]") {
    SECTION("type") {
        auto shape = type({{"a", number()}, {"b", number()}, {"c", number()}, {"d", number()}});
        auto failure = shape.decode(parse(R"({"a": "1", "b": 2, "c": "3", "d": "4"})"));
        REQUIRE(failure.error().errors().size() == 3);
    }

    SECTION("partial") {
        auto shape = partial({{"a", number()}, {"b", number()}, {"c", number()}});
        auto failure = shape.decode(parse(R"({"a": "1", "c": "3"})"));
        REQUIRE(failure.error().errors().size() == 2);
    }

    SECTION("record") {
        auto failure = record(boolean()).decode(parse(R"({"a": 1, "b": true, "c": 2, "d": 3})"));
        REQUIRE(failure.error().errors().size() == 3);
    }

    SECTION("array") {
        auto failure = array(string()).decode(parse(R"([1, "a", 2, "b", 3])"));
        REQUIRE(failure.error().errors().size() == 3);
    }

    SECTION("tuple") {
        auto failure = tuple(string(), string(), string()).decode(parse(R"([1, 2, 3])"));
        REQUIRE(failure.error().errors().size() == 3);
    }
}

// ============================================================================
// Pass-through
// ============================================================================

TEST_CASE("decoding does not modify its input", "[edge]") {
    Value input = parse(R"({"kind": "a", "items": [1, 2], "extra": {"x": null}})");
    const Value snapshot = input;

    auto shape = intersection({sum("kind", {{"a", type({{"items", array(number())}})}}), unknown_record()});
    REQUIRE(shape.decode(input).ok());
    REQUIRE(input == snapshot);

    auto failure = type({{"items", array(string())}}).decode(input);
    REQUIRE_FALSE(failure.ok());
    REQUIRE(failure.error().actual() == snapshot);
    REQUIRE(input == snapshot);
}

TEST_CASE("unknown containers round trip unchanged", "[edge]") {
    for (const char* text : {"[]", "[1, [2, [3]]]", R"({"a": {"b": {"c": [true, null]}}})"}) {
        Value input = parse(text);
        auto decoder = input.is_array() ? unknown_array() : unknown_record();
        REQUIRE(decoder.decode(input).value() == input);
        REQUIRE(intersection({}).decode(input).value() == input);
    }
}

// ============================================================================
// Sharing and concurrency
// ============================================================================

TEST_CASE("decoders are reusable values", "[edge]") {
    auto name = string();
    auto copy = name;

    REQUIRE(copy.decode(Value("a")).ok());
    REQUIRE(name.decode(Value("b")).value() == "b");
    REQUIRE_FALSE(name.decode(Value(1)).ok());
    REQUIRE(name.decode(Value("c")).ok());
}

TEST_CASE("one decoder used from many threads", "[edge][threads]") {
    auto shape = array(type({{"id", integer()}, {"tags", array(string())}}));
    Value valid = parse(R"([{"id": 1, "tags": ["a"]}, {"id": 2, "tags": []}])");
    Value invalid = parse(R"([{"id": 1.5, "tags": ["a"]}, {"id": 2, "tags": [3]}])");

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (!shape.decode(valid).ok()) {
                    ++mismatches;
                }
                auto failure = shape.decode(invalid);
                if (failure.ok() || failure.error().errors().size() != 2) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(mismatches.load() == 0);
}

// ============================================================================
// API misuse
// ============================================================================

TEST_CASE("result access checks the alternative", "[edge][result]") {
    auto success = number().decode(Value(1));
    auto failure = number().decode(Value("1"));

    REQUIRE_THROWS_AS(success.error(), BadResultAccessException);
    REQUIRE_THROWS_AS(failure.value(), BadResultAccessException);
    REQUIRE(failure.value_or(7.0) == 7.0);
    REQUIRE(success.value_or(7.0) == 1.0);

    try {
        (void)failure.value();
        FAIL("value() should have thrown");
    } catch (const ShapecheckException& e) {
        REQUIRE(e.code() == Error::BadAccess);
    }
}

TEST_CASE("decoder requires a function", "[edge]") {
    REQUIRE_THROWS_AS(Decoder<Value>(Decoder<Value>::function_type{}), InvalidArgumentException);
}

TEST_CASE("error strings", "[edge]") {
    REQUIRE(std::string(error_string(Error::InvalidArg)) == "Invalid argument");
    REQUIRE(std::string(error_string(Error::BadAccess)) == "Bad result access");
    REQUIRE(std::string(error_string(Error::InvalidData)) == "Invalid or malformed data");
}

TEST_CASE("exception messages lead with the error string", "[edge]") {
    try {
        (void)literals({});
        FAIL("literals() should have thrown");
    } catch (const InvalidArgumentException& e) {
        REQUIRE(e.code() == Error::InvalidArg);
        REQUIRE(std::string(e.what()) == "Invalid argument: literals() requires at least one value");
    }

    try {
        (void)Result<double>::success(1.0).error();
        FAIL("error() should have thrown");
    } catch (const BadResultAccessException& e) {
        REQUIRE(std::string(e.what()).rfind("Bad result access: ", 0) == 0);
    }

    try {
        (void)parse("{");
        FAIL("parse() should have thrown");
    } catch (const InvalidDataException& e) {
        REQUIRE(e.code() == Error::InvalidData);
        REQUIRE(std::string(e.what()).rfind("Invalid or malformed data: ", 0) == 0);
    }
}

TEST_CASE("version", "[edge]") {
    REQUIRE(std::string(version()) == std::to_string(VERSION_MAJOR) + "." +
                                          std::to_string(VERSION_MINOR) + "." +
                                          std::to_string(VERSION_PATCH));
}
