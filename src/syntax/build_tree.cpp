#include "syntax/build_tree.hpp"

#include "common/error.hpp"
#include "syntax/syntax_tree.hpp"
#include "syntax/tree_event.hpp"

#include <string>
#include <vector>

namespace graft {

namespace {

// A node that has been started but not yet finished, together with the
// property it will be bound to in its parent.
struct OpenNode final {
    SyntaxNodeId id;
    std::string property;
    bool list = false;

    OpenNode(SyntaxNodeId id_, std::string property_, bool list_)
        : id(id_)
        , property(std::move(property_))
        , list(list_) {}
};

class TreeBuilder final : public TreeEventConsumer {
public:
    explicit TreeBuilder(SyntaxTree& tree)
        : tree_(tree) {}

    TreeBuilder(const TreeBuilder&) = delete;
    TreeBuilder& operator=(const TreeBuilder&) = delete;

    void start_node(const TreeEvent::Start& start) override;
    void token(TreeEvent::Token& token) override;
    void finish_node() override;

    // Returns the completed top level node.
    SyntaxNodeId finish();

    // Releases all nodes created so far.
    void abandon();

private:
    void attach(SyntaxNodeId node, const std::string& property, bool list);

private:
    SyntaxTree& tree_;

    // Stack of open but not yet finished nodes.
    std::vector<OpenNode> nodes_;

    // The completed top level node.
    SyntaxNodeId result_;
};

} // namespace

SyntaxNodeId build_tree(SyntaxTree& tree, Span<TreeEvent> events) {
    TreeBuilder builder(tree);
    SyntaxNodeId root;
    try {
        consume_events(events, builder);
        root = builder.finish();
    } catch (...) {
        builder.abandon();
        throw;
    }

    tree.root_id(root);
    return root;
}

void TreeBuilder::start_node(const TreeEvent::Start& start) {
    GRAFT_CHECK(!result_, GRAFT_ERROR_BAD_ARG,
        "The event stream must describe a single top level node.");
    GRAFT_CHECK(!nodes_.empty() || start.property.empty(), GRAFT_ERROR_BAD_ARG,
        "The top level node cannot be bound to a property.");

    auto id = tree_.make_node(start.kind);
    nodes_.emplace_back(id, start.property, start.list);
}

void TreeBuilder::token(TreeEvent::Token& token) {
    GRAFT_CHECK(!nodes_.empty(), GRAFT_ERROR_BAD_ARG,
        "The token event for '{}' does not belong to any node.", token.text);

    auto id = tree_.make_token(token.kind, std::move(token.text), token.range);
    attach(id, token.property, token.list);
}

void TreeBuilder::finish_node() {
    GRAFT_CHECK(!nodes_.empty(), GRAFT_ERROR_BAD_ARG,
        "The finish event does not have a matching start event.");

    OpenNode node = std::move(nodes_.back());
    nodes_.pop_back();

    if (nodes_.empty()) {
        result_ = node.id;
        return;
    }
    attach(node.id, node.property, node.list);
}

SyntaxNodeId TreeBuilder::finish() {
    GRAFT_CHECK(nodes_.empty(), GRAFT_ERROR_BAD_ARG,
        "The event stream ended with {} unfinished node(s).", nodes_.size());
    GRAFT_CHECK(result_, GRAFT_ERROR_BAD_ARG, "The event stream did not describe any node.");
    return result_;
}

void TreeBuilder::abandon() {
    // Open nodes are only attached to their parent once they are finished, so every
    // open node is the detached root of a partial subtree.
    while (!nodes_.empty()) {
        tree_.discard(nodes_.back().id);
        nodes_.pop_back();
    }
    if (result_)
        tree_.discard(result_);
    result_ = SyntaxNodeId();
}

void TreeBuilder::attach(SyntaxNodeId node, const std::string& property, bool list) {
    SyntaxNodeId parent = nodes_.back().id;
    if (list && !property.empty()) {
        const Property* prop = tree_.find_property(parent, property);
        if (!prop || prop->type() != PropertyType::List)
            tree_.declare_list_property(parent, property);
    }
    tree_.append_child(parent, node, property);
}

} // namespace graft
