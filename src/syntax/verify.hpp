#ifndef GRAFT_SYNTAX_VERIFY_HPP
#define GRAFT_SYNTAX_VERIFY_HPP

#include "syntax/fwd.hpp"
#include "syntax/syntax_node_id.hpp"

namespace graft {

/// Verifies the structural invariants of a single node: its child list is a consistent doubly
/// linked list that matches the cached child count, every child points back to the node and
/// every property binding references a current child of the node.
///
/// Throws an internal error if verification fails.
void verify_node(const SyntaxTree& tree, SyntaxNodeId node);

/// Verifies every node in the subtree rooted at `node` (see verify_node()).
/// If `node` is the tree's root, it must not have a parent.
///
/// Throws an internal error if verification fails.
void verify_tree(const SyntaxTree& tree, SyntaxNodeId node);

} // namespace graft

#endif // GRAFT_SYNTAX_VERIFY_HPP
