/**
 * @file shapecheck.hpp
 * @brief shapecheck umbrella header.
 *
 * Typical use:
 *
 *     using namespace shapecheck;
 *     auto person = type({{"name", string()}, {"age", integer()}});
 *     auto result = person.decode(parse(R"({"name": "Ada", "age": 36})"));
 *     if (auto report = draw_result(result)) {
 *         std::fprintf(stderr, "%s\n", report->c_str());
 *     }
 */

#ifndef SHAPECHECK_HPP
#define SHAPECHECK_HPP

#include "combinators.hpp"
#include "compose.hpp"
#include "config.hpp"
#include "decode_error.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "result.hpp"
#include "tree.hpp"
#include "value.hpp"

#endif // SHAPECHECK_HPP
