#include <catch2/catch.hpp>

#include "syntax/syntax_tree.hpp"
#include "syntax/verify.hpp"

#include "support/matchers.hpp"
#include "support/test_tree.hpp"

using namespace graft;
using test_support::exception_contains_string;
using test_support::exception_matches_code;
using test_support::TestTree;

TEST_CASE("Verification should accept well formed trees", "[verify]") {
    TestTree t;
    auto& tree = t.tree();
    auto root = t.make_if_statement();

    REQUIRE_NOTHROW(verify_tree(tree, root));
    for (auto node : tree.find_if(root, [](SyntaxKind) { return true; }))
        REQUIRE_NOTHROW(verify_node(tree, node));

    auto detached = tree.make_node(t.kinds().Block);
    REQUIRE_NOTHROW(verify_node(tree, detached));
    REQUIRE_NOTHROW(verify_tree(tree, detached));
}

TEST_CASE("Verification should reject dead nodes", "[verify]") {
    TestTree t;
    auto& tree = t.tree();
    auto node = tree.make_node(t.kinds().Block);
    tree.discard(node);

    REQUIRE_THROWS_MATCHES(
        verify_node(tree, node), Error, exception_matches_code(GRAFT_ERROR_INTERNAL));
    REQUIRE_THROWS_MATCHES(
        verify_tree(tree, node), Error, exception_contains_string("not a live node"));
}

TEST_CASE("Trees should verify mutations when requested", "[verify]") {
    test_support::TestKinds k;

    TreeOptions options;
    options.verify_mutations = true;
    SyntaxTree tree(k.table, options);
    REQUIRE(tree.options().verify_mutations);

    auto root = tree.make_node(k.File);
    for (int i = 0; i < 10; ++i) {
        auto tok = tree.make_token(k.Identifier, std::to_string(i));
        if (i % 2 == 0) {
            tree.append_child(root, tok, "even");
        } else {
            tree.prepend_child(root, tok);
        }
    }
    REQUIRE(tree.serialize(root) == "9753102468");

    while (tree.remove_first(root)) {}
    REQUIRE(tree.child_count(root) == 0);
    REQUIRE(!tree.property(root, "even"));
}
