#ifndef GRAFT_SYNTAX_SYNTAX_NODE_ID_HPP
#define GRAFT_SYNTAX_SYNTAX_NODE_ID_HPP

#include "common/defs.hpp"
#include "common/id_type.hpp"

namespace graft {

/// Handle of a node within a SyntaxTree. The invalid id represents an absent node.
GRAFT_DEFINE_ID(SyntaxNodeId, u32)

} // namespace graft

#endif // GRAFT_SYNTAX_SYNTAX_NODE_ID_HPP
