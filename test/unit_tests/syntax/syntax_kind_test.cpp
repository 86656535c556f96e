#include <catch2/catch.hpp>

#include "syntax/syntax_kind.hpp"

#include "support/matchers.hpp"

using namespace graft;
using test_support::exception_matches_code;

TEST_CASE("Syntax kinds should be registered by name", "[syntax-kind]") {
    SyntaxKindTable table;
    REQUIRE(table.size() == 0);

    auto stmt = table.define("Statement");
    auto if_stmt = table.define("IfStmt", {stmt});
    REQUIRE(table.size() == 2);

    REQUIRE(table.contains(stmt));
    REQUIRE(table.contains(if_stmt));
    REQUIRE(!table.contains(SyntaxKind()));
    REQUIRE(!table.contains(SyntaxKind(2)));

    REQUIRE(table.name(stmt) == "Statement");
    REQUIRE(table.name(if_stmt) == "IfStmt");

    REQUIRE(table.find("IfStmt") == if_stmt);
    REQUIRE(!table.find("Expression"));

    auto bases = table.bases(if_stmt);
    REQUIRE(bases.size() == 1);
    REQUIRE(bases[0] == stmt);
    REQUIRE(table.bases(stmt).empty());
}

TEST_CASE("Syntax kinds should support transitive is-a checks", "[syntax-kind]") {
    SyntaxKindTable table;
    auto node = table.define("Node");
    auto named = table.define("NamedNode", {node});
    auto scoped = table.define("ScopeNode");
    auto func = table.define("FuncDecl", {named, scoped});
    auto var = table.define("VarDecl", {named});

    REQUIRE(table.is_a(func, func));
    REQUIRE(table.is_a(func, named));
    REQUIRE(table.is_a(func, scoped));
    REQUIRE(table.is_a(func, node));

    REQUIRE(table.is_a(var, node));
    REQUIRE(!table.is_a(var, scoped));
    REQUIRE(!table.is_a(var, func));
    REQUIRE(!table.is_a(node, named));
}

TEST_CASE("Invalid kind definitions should be rejected", "[syntax-kind]") {
    SyntaxKindTable table;
    auto stmt = table.define("Statement");

    REQUIRE_THROWS_MATCHES(table.define(""), Error, exception_matches_code(GRAFT_ERROR_BAD_ARG));
    REQUIRE_THROWS_MATCHES(
        table.define("Statement"), Error, exception_matches_code(GRAFT_ERROR_BAD_ARG));
    REQUIRE_THROWS_MATCHES(table.define("IfStmt", {stmt, SyntaxKind(7)}), Error,
        exception_matches_code(GRAFT_ERROR_BAD_ARG));
    REQUIRE_THROWS_MATCHES(
        table.name(SyntaxKind(5)), Error, exception_matches_code(GRAFT_ERROR_BAD_ARG));

    REQUIRE(table.size() == 1);
}
