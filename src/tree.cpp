/**
 * @file tree.cpp
 * @brief DecodeError report rendering.
 */

#include <shapecheck/tree.hpp>

#include <shapecheck/value.hpp>

namespace shapecheck {

namespace {

std::string describe(const DecodeError& error) {
    return "Cannot decode " + stringify(error.actual()) + ", expected " + error.expected();
}

void draw_forest(std::string& out, const std::string& indentation, const std::vector<Tree>& forest) {
    const std::size_t len = forest.size();
    for (std::size_t i = 0; i < len; ++i) {
        const bool is_last = (i + 1 == len);
        out += indentation;
        out += is_last ? "└" : "├";
        out += "─ ";
        out += forest[i].value;
        draw_forest(out, indentation + ((len > 1 && !is_last) ? "│  " : "   "), forest[i].forest);
    }
}

} // namespace

Tree to_tree(const DecodeError& error) {
    Tree tree{describe(error), {}};
    tree.forest.reserve(error.errors().size());

    for (const auto& entry : error.errors()) {
        Tree child = to_tree(entry.error);
        switch (error.kind()) {
        case ErrorKind::Indexed:
            child.value = "(" + std::to_string(entry.index) + ") " + child.value;
            break;
        case ErrorKind::Labeled:
            child.value = "(" + quote(entry.key) + ") " + child.value;
            break;
        default:
            break;
        }
        tree.forest.push_back(std::move(child));
    }
    return tree;
}

std::string draw_tree(const Tree& tree) {
    std::string out = tree.value;
    draw_forest(out, "\n", tree.forest);
    return out;
}

std::string draw(const DecodeError& error) {
    return draw_tree(to_tree(error));
}

} // namespace shapecheck
