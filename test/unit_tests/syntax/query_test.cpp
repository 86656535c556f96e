#include <catch2/catch.hpp>

#include "syntax/syntax_tree.hpp"

#include "support/matchers.hpp"
#include "support/test_tree.hpp"

using namespace graft;
using test_support::exception_matches_code;
using test_support::TestTree;

using Ids = std::vector<SyntaxNodeId>;

TEST_CASE("Serializing an unmodified tree should reproduce the source", "[query]") {
    TestTree t;
    auto root = t.make_if_statement();
    REQUIRE(t.tree().serialize(root) == "if (x) { y; } // done");

    auto body = t.tree().property(root, "body");
    REQUIRE(t.tree().serialize(body) == "{ y; }");

    std::string out = ">";
    t.tree().serialize_to(body, out);
    REQUIRE(out == ">{ y; }");
}

TEST_CASE("Serializing a token should return its text", "[query]") {
    TestTree t;
    auto tok = t.token(t.kinds().Comment, "/* c */");
    REQUIRE(t.tree().serialize(tok) == "/* c */");
}

TEST_CASE("Filter should return matching direct children", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();
    auto root = t.make_if_statement();

    auto trivia = tree.filter(root, k.Trivia);
    REQUIRE(trivia.size() == 4);
    for (auto id : trivia)
        REQUIRE(tree.parent(id) == root);
    REQUIRE(tree.text(trivia[3]) == "// done");

    auto statements = tree.filter(root, k.Statement);
    REQUIRE(statements == Ids{tree.property(root, "body")});

    auto punct = tree.filter_if(root, [&](SyntaxKind kind) { return kind == k.Punct; });
    REQUIRE(punct.size() == 2);
    REQUIRE(tree.text(punct[0]) == "(");
    REQUIRE(tree.text(punct[1]) == ")");

    REQUIRE(tree.filter(root, k.BinaryExpr).empty());
}

TEST_CASE("Find should return matches in pre-order", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    // Root(A, B(C, D))
    auto a = t.token(k.Identifier, "a");
    auto c = t.token(k.Identifier, "c");
    auto d = t.token(k.Identifier, "d");
    auto b = t.node(k.VarExpr, {c, d});
    auto root = t.node(k.File, {a, b});

    REQUIRE(tree.find(root, k.Identifier) == Ids{a, c, d});
    REQUIRE(tree.find(root, k.Expression) == Ids{b});
    REQUIRE(tree.find(root, k.File) == Ids{root});
    REQUIRE(tree.find(b, k.Identifier) == Ids{c, d});
    REQUIRE(tree.find(c, k.Identifier) == Ids{c});
    REQUIRE(tree.find(root, k.Statement).empty());

    auto all = tree.find_if(root, [](SyntaxKind) { return true; });
    REQUIRE(all == Ids{root, a, b, c, d});
}

TEST_CASE("Find should not leave the subtree", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();
    auto root = t.make_if_statement();

    auto cond = tree.property(root, "condition");
    auto ids = tree.find(cond, k.Identifier);
    REQUIRE(ids.size() == 1);
    REQUIRE(tree.text(ids[0]) == "x");

    REQUIRE(t.token_texts(cond) == "x");
    REQUIRE(tree.find(root, k.Identifier).size() == 2);
    REQUIRE(tree.find(root, k.Expression).size() == 2);
}

TEST_CASE("First and last tokens should be found at the boundaries", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    auto root = t.make_if_statement();

    REQUIRE(tree.text(tree.first_token(root)) == "if");
    REQUIRE(tree.text(tree.last_token(root)) == "// done");

    auto body = tree.property(root, "body");
    REQUIRE(tree.text(tree.first_token(body)) == "{");
    REQUIRE(tree.text(tree.last_token(body)) == "}");

    auto tok = tree.first(root);
    REQUIRE(tree.first_token(tok) == tok);
    REQUIRE(tree.last_token(tok) == tok);
}

TEST_CASE("First and last tokens should not exist in empty subtrees", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    auto empty = tree.make_node(k.Block);
    auto root = t.node(k.File, {empty, t.token(k.Identifier, "a")});

    REQUIRE_THROWS_MATCHES(
        tree.first_token(empty), Error, exception_matches_code(GRAFT_ERROR_EMPTY_SUBTREE));
    REQUIRE_THROWS_MATCHES(
        tree.last_token(empty), Error, exception_matches_code(GRAFT_ERROR_EMPTY_SUBTREE));

    // Descends into the empty block at the left boundary.
    REQUIRE_THROWS_MATCHES(
        tree.first_token(root), Error, exception_matches_code(GRAFT_ERROR_EMPTY_SUBTREE));
    REQUIRE(tree.text(tree.last_token(root)) == "a");
}

TEST_CASE("Source positions should be the range of the first token", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    auto root = t.make_if_statement();

    REQUIRE((tree.source_position(root) == SourceRange(0, 2)));

    auto cond = tree.property(root, "condition");
    REQUIRE((tree.source_position(cond) == SourceRange(4, 5)));

    auto body = tree.property(root, "body");
    REQUIRE((tree.source_position(body) == SourceRange(7, 8)));
}

TEST_CASE("Nodes without tokens should report the position of their parent", "[query]") {
    TestTree t;
    auto& tree = t.tree();
    const auto& k = t.kinds();

    auto x = t.token(k.Identifier, "x");
    auto empty = tree.make_node(k.Block);
    auto nested_empty = t.node(k.Block, {tree.make_node(k.Block)});
    auto root = t.node(k.File, {empty, nested_empty, x});

    REQUIRE((tree.source_position(empty) == SourceRange(0, 1)));
    REQUIRE((tree.source_position(nested_empty) == SourceRange(0, 1)));
    REQUIRE((tree.source_position(tree.first(nested_empty)) == SourceRange(0, 1)));

    // Empty leading children are skipped
    REQUIRE((tree.source_position(root) == SourceRange(0, 1)));

    auto detached = tree.make_node(k.Block);
    REQUIRE_THROWS_MATCHES(
        tree.source_position(detached), Error, exception_matches_code(GRAFT_ERROR_EMPTY_SUBTREE));
}
