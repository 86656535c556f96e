#include <catch2/catch.hpp>

#include "syntax/property.hpp"

using namespace graft;

TEST_CASE("Single properties should track one node", "[property]") {
    auto prop = Property::make_single(SyntaxNodeId(3));
    REQUIRE(prop.type() == PropertyType::Single);
    REQUIRE(prop.as_single().node == SyntaxNodeId(3));
    REQUIRE(prop.references(SyntaxNodeId(3)));
    REQUIRE(!prop.references(SyntaxNodeId(4)));
    REQUIRE(prop.nodes().size() == 1);

    REQUIRE(prop.replace_references(SyntaxNodeId(4), SyntaxNodeId(5)) == 0);
    REQUIRE(prop.replace_references(SyntaxNodeId(3), SyntaxNodeId(5)) == 1);
    REQUIRE(prop.as_single().node == SyntaxNodeId(5));

    REQUIRE(prop.replace_references(SyntaxNodeId(5), SyntaxNodeId()) == 1);
    REQUIRE(!prop.as_single().node);
    REQUIRE(prop.nodes().empty());
}

TEST_CASE("List properties should keep their order", "[property]") {
    auto prop = Property::make_list({SyntaxNodeId(1), SyntaxNodeId(2), SyntaxNodeId(3)});
    REQUIRE(prop.type() == PropertyType::List);

    REQUIRE(prop.replace_references(SyntaxNodeId(2), SyntaxNodeId(7)) == 1);
    REQUIRE(prop.as_list().nodes
            == std::vector<SyntaxNodeId>{SyntaxNodeId(1), SyntaxNodeId(7), SyntaxNodeId(3)});

    REQUIRE(prop.replace_references(SyntaxNodeId(1), SyntaxNodeId()) == 1);
    REQUIRE(prop.as_list().nodes == std::vector<SyntaxNodeId>{SyntaxNodeId(7), SyntaxNodeId(3)});

    auto nodes = prop.nodes();
    REQUIRE(nodes.size() == 2);
    REQUIRE(nodes[0] == SyntaxNodeId(7));
    REQUIRE(nodes[1] == SyntaxNodeId(3));
}

TEST_CASE("Properties should support move assignment between types", "[property]") {
    auto prop = Property::make_single(SyntaxNodeId(1));
    prop = Property::make_list({SyntaxNodeId(2)});
    REQUIRE(prop.type() == PropertyType::List);
    REQUIRE(prop.as_list().nodes.size() == 1);

    prop = Property::make_single(SyntaxNodeId(4));
    REQUIRE(prop.type() == PropertyType::Single);
    REQUIRE(prop.as_single().node == SyntaxNodeId(4));
}

TEST_CASE("Properties should be formattable", "[property]") {
    REQUIRE(fmt::format("{}", Property::make_single(SyntaxNodeId(1))) == "Single(SyntaxNodeId(1))");
    REQUIRE(fmt::format("{}", Property::make_list({SyntaxNodeId(1), SyntaxNodeId(2)}))
            == "List(SyntaxNodeId(1), SyntaxNodeId(2))");
    REQUIRE(fmt::format("{}", PropertyType::List) == "List");
}
