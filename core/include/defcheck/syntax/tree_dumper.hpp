// defcheck/syntax/tree_dumper.hpp - JSON serialization of syntax trees
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "defcheck/syntax/syntax_tree.hpp"

namespace defcheck
{

/**
 * Serialize a subtree to JSON.
 *
 * Each node becomes an object with "kind", "line", "column", "end_line",
 * optional "field", "text" (leaves only) and "children".
 */
[[nodiscard]] nlohmann::json to_json(const SyntaxTree & tree, NodeId id);

/// Serialize a whole tree, including the file name
[[nodiscard]] nlohmann::json to_json(const SyntaxTree & tree);

[[nodiscard]] std::string dump_tree_json(const SyntaxTree & tree, int indent = 2);

}  // namespace defcheck
