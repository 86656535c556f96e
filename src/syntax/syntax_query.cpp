#include "syntax/syntax_tree.hpp"

#include "common/error.hpp"

namespace graft {

std::vector<SyntaxNodeId> SyntaxTree::filter(SyntaxNodeId parent, SyntaxKind kind) const {
    return filter_if(parent, [&](SyntaxKind child_kind) { return kinds_->is_a(child_kind, kind); });
}

std::vector<SyntaxNodeId>
SyntaxTree::filter_if(SyntaxNodeId parent, FunctionRef<bool(SyntaxKind)> pred) const {
    std::vector<SyntaxNodeId> result;
    for (auto child : children(parent)) {
        if (pred(get(child).kind()))
            result.push_back(child);
    }
    return result;
}

std::vector<SyntaxNodeId> SyntaxTree::find(SyntaxNodeId node, SyntaxKind kind) const {
    return find_if(node, [&](SyntaxKind node_kind) { return kinds_->is_a(node_kind, kind); });
}

std::vector<SyntaxNodeId>
SyntaxTree::find_if(SyntaxNodeId node, FunctionRef<bool(SyntaxKind)> pred) const {
    std::vector<SyntaxNodeId> result;
    walk_preorder(node, [&](SyntaxNodeId current) {
        if (pred(get(current).kind()))
            result.push_back(current);
    });
    return result;
}

SyntaxNodeId SyntaxTree::first_token(SyntaxNodeId node) const {
    SyntaxNodeId current = node;
    while (1) {
        const auto& data = get(current);
        if (data.is_token())
            return current;

        const auto& comp = data.as_composite();
        GRAFT_CHECK(comp.head, GRAFT_ERROR_EMPTY_SUBTREE,
            "Node {} has no children, the subtree of {} has no first token.", current, node);
        current = comp.head;
    }
}

SyntaxNodeId SyntaxTree::last_token(SyntaxNodeId node) const {
    SyntaxNodeId current = node;
    while (1) {
        const auto& data = get(current);
        if (data.is_token())
            return current;

        const auto& comp = data.as_composite();
        GRAFT_CHECK(comp.tail, GRAFT_ERROR_EMPTY_SUBTREE,
            "Node {} has no children, the subtree of {} has no last token.", current, node);
        current = comp.tail;
    }
}

SyntaxNodeId SyntaxTree::find_first_token(SyntaxNodeId node) const {
    SyntaxNodeId token;
    walk_preorder(node, [&](SyntaxNodeId current) {
        if (get(current).is_token()) {
            token = current;
            return false;
        }
        return true;
    });
    return token;
}

SourceRange SyntaxTree::source_position(SyntaxNodeId node) const {
    SyntaxNodeId current = node;
    while (current) {
        if (SyntaxNodeId token = find_first_token(current))
            return get(token).as_token().range;
        current = get(current).parent();
    }
    GRAFT_ERROR_WITH_CODE(GRAFT_ERROR_EMPTY_SUBTREE,
        "Node {} and its ancestors do not contain any tokens.", node);
}

std::string SyntaxTree::serialize(SyntaxNodeId node) const {
    std::string result;
    serialize_to(node, result);
    return result;
}

void SyntaxTree::serialize_to(SyntaxNodeId node, std::string& out) const {
    walk_preorder(node, [&](SyntaxNodeId current) {
        const auto& data = get(current);
        if (data.is_token())
            out += data.as_token().text;
    });
}

} // namespace graft
