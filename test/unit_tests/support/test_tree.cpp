#include "support/test_tree.hpp"

#include <fmt/format.h>

namespace graft::test_support {

TestKinds::TestKinds() {
    Statement = table.define("Statement");
    Expression = table.define("Expression");
    Trivia = table.define("Trivia");

    File = table.define("File");
    Block = table.define("Block", {Statement});
    IfStmt = table.define("IfStmt", {Statement});
    ExprStmt = table.define("ExprStmt", {Statement});
    VarExpr = table.define("VarExpr", {Expression});
    BinaryExpr = table.define("BinaryExpr", {Expression});
    ArgList = table.define("ArgList");

    Keyword = table.define("Keyword");
    Identifier = table.define("Identifier");
    Operator = table.define("Operator");
    Punct = table.define("Punct");
    Whitespace = table.define("Whitespace", {Trivia});
    Comment = table.define("Comment", {Trivia});
}

TestTree::TestTree()
    : tree_(kinds_.table, TreeOptions{true}) {}

SyntaxNodeId TestTree::token(SyntaxKind kind, std::string text) {
    u32 begin = offset_;
    offset_ += static_cast<u32>(text.size());
    return tree_.make_token(kind, std::move(text), SourceRange(begin, offset_));
}

SyntaxNodeId TestTree::node(SyntaxKind kind, std::initializer_list<SyntaxNodeId> children) {
    auto id = tree_.make_node(kind);
    for (auto child : children)
        tree_.append_child(id, child);
    return id;
}

SyntaxNodeId TestTree::make_if_statement() {
    const auto& k = kinds_;

    auto if_stmt = tree_.make_node(k.IfStmt);
    tree_.append_child(if_stmt, token(k.Keyword, "if"));
    tree_.append_child(if_stmt, token(k.Whitespace, " "));
    tree_.append_child(if_stmt, token(k.Punct, "("));
    tree_.append_child(if_stmt, node(k.VarExpr, {token(k.Identifier, "x")}), "condition");
    tree_.append_child(if_stmt, token(k.Punct, ")"));
    tree_.append_child(if_stmt, token(k.Whitespace, " "));

    auto block = tree_.make_node(k.Block);
    tree_.append_child(block, token(k.Punct, "{"));
    tree_.append_child(block, token(k.Whitespace, " "));
    tree_.append_child(block,
        node(k.ExprStmt, {node(k.VarExpr, {token(k.Identifier, "y")}), token(k.Punct, ";")}));
    tree_.append_child(block, token(k.Whitespace, " "));
    tree_.append_child(block, token(k.Punct, "}"));
    tree_.append_child(if_stmt, block, "body");

    tree_.append_child(if_stmt, token(k.Whitespace, " "));
    tree_.append_child(if_stmt, token(k.Comment, "// done"));

    tree_.root_id(if_stmt);
    return if_stmt;
}

std::string TestTree::token_texts(SyntaxNodeId node) {
    std::vector<std::string_view> texts;
    for (auto id : tree_.find_if(node, [&](SyntaxKind) { return true; })) {
        if (tree_.is_token(id))
            texts.push_back(tree_.text(id));
    }
    return fmt::format("{}", fmt::join(texts, "|"));
}

std::vector<SyntaxNodeId> to_vector(const ChildRange& range) {
    return std::vector<SyntaxNodeId>(range.begin(), range.end());
}

} // namespace graft::test_support
