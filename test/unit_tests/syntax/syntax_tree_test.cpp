#include <catch2/catch.hpp>

#include "syntax/syntax_tree.hpp"

#include "support/matchers.hpp"
#include "support/test_tree.hpp"

using namespace graft;
using test_support::exception_matches_code;
using test_support::TestTree;
using test_support::to_vector;

TEST_CASE("New nodes should be detached", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    auto tok = tree.make_token(k.Identifier, "foo", SourceRange(3, 6));
    auto node = tree.make_node(k.VarExpr);
    REQUIRE(tree.size() == 2);
    REQUIRE(tree.contains(tok));
    REQUIRE(tree.contains(node));
    REQUIRE(!tree.root_id());

    REQUIRE(tree.is_token(tok));
    REQUIRE(!tree.is_composite(tok));
    REQUIRE(tree.kind(tok) == k.Identifier);
    REQUIRE(tree.text(tok) == "foo");
    REQUIRE((tree[tok].as_token().range == SourceRange(3, 6)));
    REQUIRE(!tree.parent(tok));

    REQUIRE(tree.is_composite(node));
    REQUIRE(tree.kind(node) == k.VarExpr);
    REQUIRE(tree.is_a(node, k.Expression));
    REQUIRE(!tree.is_a(node, k.Statement));
    REQUIRE(tree.child_count(node) == 0);
    REQUIRE(!tree.first(node));
    REQUIRE(!tree.last(node));
    REQUIRE(to_vector(tree.children(node)).empty());
}

TEST_CASE("Tokens should report no children", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();
    auto tok = t.token(t.kinds().Identifier, "x");

    REQUIRE(tree.child_count(tok) == 0);
    REQUIRE(!tree.first(tok));
    REQUIRE(!tree.last(tok));
    REQUIRE(to_vector(tree.children(tok)).empty());
    REQUIRE(tree.property_names(tok).empty());
    REQUIRE(!tree.property(tok, "name"));
    REQUIRE(tree.filter(tok, t.kinds().Identifier).empty());
}

TEST_CASE("Nodes should be created with known kinds only", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();

    REQUIRE_THROWS_MATCHES(
        tree.make_node(SyntaxKind(999)), Error, exception_matches_code(GRAFT_ERROR_BAD_ARG));
    REQUIRE_THROWS_MATCHES(tree.make_token(SyntaxKind(), "x"), Error,
        exception_matches_code(GRAFT_ERROR_BAD_ARG));
    REQUIRE(tree.size() == 0);
}

TEST_CASE("Invalid node ids should be rejected", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();

    REQUIRE(!tree.contains(SyntaxNodeId()));
    REQUIRE(!tree.contains(SyntaxNodeId(0)));
    REQUIRE_THROWS_MATCHES(tree.kind(SyntaxNodeId(0)), Error,
        exception_matches_code(GRAFT_ERROR_BAD_NODE));
    REQUIRE_THROWS_MATCHES(
        tree.parent(SyntaxNodeId()), Error, exception_matches_code(GRAFT_ERROR_BAD_NODE));
}

TEST_CASE("Text queries on composite nodes should be rejected", "[syntax-tree]") {
    TestTree t;
    auto node = t.node(t.kinds().Block);
    REQUIRE_THROWS_MATCHES(
        t.tree().text(node), Error, exception_matches_code(GRAFT_ERROR_BAD_ARG));
}

TEST_CASE("Children should be navigable in both directions", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    auto a = t.token(k.Identifier, "a");
    auto plus = t.token(k.Operator, "+");
    auto b = t.token(k.Identifier, "b");
    auto expr = t.node(k.BinaryExpr, {a, plus, b});

    REQUIRE(tree.child_count(expr) == 3);
    REQUIRE(tree.first(expr) == a);
    REQUIRE(tree.last(expr) == b);
    REQUIRE(to_vector(tree.children(expr)) == std::vector<SyntaxNodeId>{a, plus, b});

    REQUIRE(tree.next(a) == plus);
    REQUIRE(tree.next(plus) == b);
    REQUIRE(!tree.next(b));
    REQUIRE(tree.previous(b) == plus);
    REQUIRE(tree.previous(plus) == a);
    REQUIRE(!tree.previous(a));

    for (auto child : tree.children(expr))
        REQUIRE(tree.parent(child) == expr);

    REQUIRE(tree.is_inclusive_ancestor(expr, a));
    REQUIRE(tree.is_inclusive_ancestor(expr, expr));
    REQUIRE(!tree.is_inclusive_ancestor(a, expr));
}

TEST_CASE("The root must be a detached node", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    auto child = t.token(k.Identifier, "x");
    auto root = t.node(k.VarExpr, {child});

    tree.root_id(root);
    REQUIRE(tree.root_id() == root);

    REQUIRE_THROWS_MATCHES(
        tree.root_id(child), Error, exception_matches_code(GRAFT_ERROR_ALREADY_ATTACHED));
    REQUIRE(tree.root_id() == root);

    tree.root_id(SyntaxNodeId());
    REQUIRE(!tree.root_id());
}

TEST_CASE("Discarded subtrees should free their slots", "[syntax-tree]") {
    TestTree t;
    auto& tree = t.tree();
    auto root = t.make_if_statement();
    auto body = tree.property(root, "body");
    size_t total = tree.size();

    REQUIRE_THROWS_MATCHES(
        tree.discard(body), Error, exception_matches_code(GRAFT_ERROR_ALREADY_ATTACHED));

    tree.detach(body);
    tree.discard(body);
    REQUIRE(tree.size() == total - 9);
    REQUIRE(!tree.contains(body));
    REQUIRE(tree.serialize(root) == "if (x)  // done");

    // Slots are reused
    auto node = tree.make_node(t.kinds().Block);
    REQUIRE(node.value() < total);
    REQUIRE(tree.size() == total - 8);

    tree.discard(root);
    REQUIRE(!tree.root_id());
    REQUIRE(tree.size() == 1);
}

TEST_CASE("Trees should be movable", "[syntax-tree]") {
    TestTree t;
    auto root = t.make_if_statement();

    size_t total = t.tree().size();

    SyntaxTree moved = std::move(t.tree());
    REQUIRE(moved.root_id() == root);
    REQUIRE(moved.size() == total);
    REQUIRE(moved.serialize(root) == "if (x) { y; } // done");

    // The moved-from tree is empty but still usable.
    REQUIRE(t.tree().size() == 0);
    REQUIRE(!t.tree().root_id());
    REQUIRE(!t.tree().contains(root));

    SyntaxTree other(t.kinds().table);
    other.make_node(t.kinds().File);
    other = std::move(moved);
    REQUIRE(other.size() == total);
    REQUIRE(other.root_id() == root);
    REQUIRE(moved.size() == 0);
    REQUIRE(!moved.root_id());
}

TEST_CASE("Syntax nodes should be formattable", "[syntax-tree]") {
    TestTree t;
    auto tok = t.token(t.kinds().Identifier, "abc");
    REQUIRE(!fmt::format("{}", t.tree()[tok]).empty());
    REQUIRE(fmt::format("{}", tok) == "SyntaxNodeId(0)");
}
