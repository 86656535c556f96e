#ifndef GRAFT_SYNTAX_BUILD_TREE_HPP
#define GRAFT_SYNTAX_BUILD_TREE_HPP

#include "common/adt/span.hpp"
#include "syntax/fwd.hpp"
#include "syntax/syntax_node_id.hpp"

namespace graft {

/// Constructs the nodes described by the given span of tree events inside `tree`.
/// The events must describe exactly one top level node, which becomes the new root of the tree.
/// Returns the id of that node.
///
/// Throws `GRAFT_ERROR_BAD_ARG` if the event stream is not well formed. Nodes created
/// before the error was detected are discarded.
/// Note that the span is modified as a side effect (token texts are moved into the tree).
SyntaxNodeId build_tree(SyntaxTree& tree, Span<TreeEvent> events);

} // namespace graft

#endif // GRAFT_SYNTAX_BUILD_TREE_HPP
