#include "syntax/verify.hpp"

#include "common/error.hpp"
#include "syntax/syntax_tree.hpp"

#include <fmt/format.h>

#include <vector>

namespace graft {

namespace {

class NodeVerifier final {
public:
    explicit NodeVerifier(const SyntaxTree& tree)
        : tree_(tree) {}

    void verify(SyntaxNodeId node);

    [[noreturn]] GRAFT_COLD void fail(SyntaxNodeId node, std::string_view message);

private:
    void verify_links(SyntaxNodeId node);
    void verify_children(SyntaxNodeId node, const SyntaxNode::Composite& data);
    void verify_properties(SyntaxNodeId node, const SyntaxNode::Composite& data);

private:
    const SyntaxTree& tree_;
};

} // namespace

void verify_node(const SyntaxTree& tree, SyntaxNodeId node) {
    NodeVerifier verifier(tree);
    verifier.verify(node);
}

void verify_tree(const SyntaxTree& tree, SyntaxNodeId root) {
    NodeVerifier verifier(tree);
    if (!tree.contains(root))
        verifier.fail(root, "not a live node");
    if (root == tree.root_id() && tree.parent(root))
        verifier.fail(root, "the root must not have a parent");

    // Every node is visited at most once in a tree, so the number of visits is bounded
    // by the number of live nodes.
    size_t visited = 0;
    std::vector<SyntaxNodeId> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        SyntaxNodeId node = stack.back();
        stack.pop_back();

        if (++visited > tree.size())
            verifier.fail(node, "the tree contains a cycle");

        verifier.verify(node);
        for (auto child : tree.children(node))
            stack.push_back(child);
    }
}

void NodeVerifier::verify(SyntaxNodeId node) {
    if (!tree_.contains(node))
        fail(node, "not a live node");

    verify_links(node);

    const auto& data = tree_[node];
    if (data.is_composite()) {
        verify_children(node, data.as_composite());
        verify_properties(node, data.as_composite());
    }
}

void NodeVerifier::fail(SyntaxNodeId node, std::string_view message) {
    GRAFT_ERROR("Syntax tree verification failed for {}: {}.", node, message);
}

void NodeVerifier::verify_links(SyntaxNodeId node) {
    const auto& data = tree_[node];
    SyntaxNodeId parent = data.parent();
    if (!parent) {
        if (data.previous() || data.next())
            fail(node, "a node without a parent must not have siblings");
        return;
    }

    if (!tree_.contains(parent))
        fail(node, "the parent is not a live node");
    if (!tree_.is_composite(parent))
        fail(node, "the parent is not a composite node");

    if (SyntaxNodeId prev = data.previous()) {
        if (!tree_.contains(prev) || tree_.next(prev) != node)
            fail(node, "the previous sibling does not link back to the node");
    } else if (tree_.first(parent) != node) {
        fail(node, "a node without a previous sibling must be the first child");
    }

    if (SyntaxNodeId next = data.next()) {
        if (!tree_.contains(next) || tree_.previous(next) != node)
            fail(node, "the next sibling does not link back to the node");
    } else if (tree_.last(parent) != node) {
        fail(node, "a node without a next sibling must be the last child");
    }
}

void NodeVerifier::verify_children(SyntaxNodeId node, const SyntaxNode::Composite& data) {
    if (!data.head != !data.tail)
        fail(node, "head and tail must either both be set or both be unset");

    u32 count = 0;
    SyntaxNodeId prev;
    SyntaxNodeId child = data.head;
    while (child) {
        if (++count > data.child_count)
            fail(node, fmt::format("more than {} children are linked", data.child_count));
        if (!tree_.contains(child))
            fail(node, fmt::format("child {} is not a live node", child));

        const auto& child_data = tree_[child];
        if (child_data.parent() != node)
            fail(node, fmt::format("child {} has a different parent {}", child, child_data.parent()));
        if (child_data.previous() != prev)
            fail(node, fmt::format("child {} has an invalid previous link", child));

        prev = child;
        child = child_data.next();
    }

    if (count != data.child_count)
        fail(node, fmt::format("expected {} children but found {}", data.child_count, count));
    if (prev != data.tail)
        fail(node, "the last child is not the tail of the child list");
}

void NodeVerifier::verify_properties(SyntaxNodeId node, const SyntaxNode::Composite& data) {
    for (const auto& [name, prop] : data.properties) {
        if (name.empty())
            fail(node, "property names must not be empty");

        for (auto bound : prop.nodes()) {
            if (!tree_.contains(bound) || tree_.parent(bound) != node) {
                fail(node, fmt::format("property '{}' references {}, which is not a child", name, bound));
            }
        }
    }
}

} // namespace graft
