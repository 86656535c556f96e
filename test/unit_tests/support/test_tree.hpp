#ifndef GRAFT_TEST_SUPPORT_TEST_TREE_HPP
#define GRAFT_TEST_SUPPORT_TEST_TREE_HPP

#include "syntax/syntax_kind.hpp"
#include "syntax/syntax_tree.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace graft::test_support {

/// A small kind hierarchy modeled after a C-like language.
struct TestKinds {
    SyntaxKindTable table;

    // Abstract kinds
    SyntaxKind Statement;
    SyntaxKind Expression;
    SyntaxKind Trivia;

    // Composite kinds
    SyntaxKind File;
    SyntaxKind Block;
    SyntaxKind IfStmt;
    SyntaxKind ExprStmt;
    SyntaxKind VarExpr;
    SyntaxKind BinaryExpr;
    SyntaxKind ArgList;

    // Token kinds
    SyntaxKind Keyword;
    SyntaxKind Identifier;
    SyntaxKind Operator;
    SyntaxKind Punct;
    SyntaxKind Whitespace;
    SyntaxKind Comment;

    TestKinds();
};

/// Wraps a syntax tree together with its kind table. Tokens created through this class
/// receive consecutive source ranges, so tokens should be created in document order.
class TestTree {
public:
    TestTree();

    TestTree(const TestTree&) = delete;
    TestTree& operator=(const TestTree&) = delete;

    const TestKinds& kinds() const { return kinds_; }
    SyntaxTree& tree() { return tree_; }

    /// Creates a detached token with the next source range.
    SyntaxNodeId token(SyntaxKind kind, std::string text);

    /// Creates a detached composite node with the given children.
    SyntaxNodeId node(SyntaxKind kind, std::initializer_list<SyntaxNodeId> children = {});

    /// Creates the tree for `if (x) { y; } // done` and makes it the root.
    /// The IfStmt binds the properties "condition" (the VarExpr) and "body" (the Block).
    SyntaxNodeId make_if_statement();

    /// Returns the text of all tokens in the subtree, joined by "|" (for readable assertions).
    std::string token_texts(SyntaxNodeId node);

private:
    TestKinds kinds_;
    SyntaxTree tree_;
    u32 offset_ = 0;
};

/// Returns the ids in the range as a vector.
std::vector<SyntaxNodeId> to_vector(const ChildRange& range);

} // namespace graft::test_support

#endif // GRAFT_TEST_SUPPORT_TEST_TREE_HPP
