#ifndef GRAFT_SYNTAX_FWD_HPP
#define GRAFT_SYNTAX_FWD_HPP

#include "common/defs.hpp"

namespace graft {

class SourceRange;

class SyntaxKind;
class SyntaxKindTable;

enum class PropertyType : u8;
class Property;

class SyntaxNodeId;
enum class SyntaxNodeType : u8;
class SyntaxNode;

struct TreeOptions;
class SyntaxTree;
class ChildRange;

enum class TreeEventType : u8;
class TreeEvent;

} // namespace graft

#endif // GRAFT_SYNTAX_FWD_HPP
