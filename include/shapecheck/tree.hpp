/**
 * @file tree.hpp
 * @brief Render a DecodeError as a multi-line report.
 *
 * Each node reads "Cannot decode <json of actual>, expected <expected>".
 * Children of an Indexed node are prefixed with "(<index>) ", children of a
 * Labeled node with "(<quoted key>) "; And/Or children carry no prefix:
 *
 *     Cannot decode {"a":1}, expected type
 *     └─ ("a") Cannot decode 1, expected string
 */

#ifndef SHAPECHECK_TREE_HPP
#define SHAPECHECK_TREE_HPP

#include <optional>
#include <string>
#include <vector>

#include "decode_error.hpp"
#include "result.hpp"

namespace shapecheck {

/**
 * @brief Labeled rose tree of report lines.
 */
struct Tree {
    std::string value;
    std::vector<Tree> forest;
};

/**
 * @brief Convert an error into a tree of report lines.
 */
Tree to_tree(const DecodeError& error);

/**
 * @brief Draw a tree with box-drawing guides, one node per line.
 *
 * The root is on the first line; no trailing newline is emitted.
 */
std::string draw_tree(const Tree& tree);

/**
 * @brief to_tree() followed by draw_tree().
 */
std::string draw(const DecodeError& error);

/**
 * @brief Report for a failed result, nothing for a success.
 */
template <typename A> std::optional<std::string> draw_result(const Result<A>& result) {
    if (result) {
        return std::nullopt;
    }
    return draw(result.error());
}

} // namespace shapecheck

#endif // SHAPECHECK_TREE_HPP
