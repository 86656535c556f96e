#ifndef GRAFT_SYNTAX_SYNTAX_NODE_HPP
#define GRAFT_SYNTAX_SYNTAX_NODE_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/format.hpp"
#include "syntax/fwd.hpp"
#include "syntax/property.hpp"
#include "syntax/source_range.hpp"
#include "syntax/syntax_kind.hpp"
#include "syntax/syntax_node_id.hpp"

#include <absl/container/flat_hash_map.h>

#include <string>

namespace graft {

/// Represents the type of a SyntaxNode.
enum class SyntaxNodeType : u8 {
    Token,
    Composite,
};

std::string_view to_string(SyntaxNodeType type);

/// A node stored in a SyntaxTree.
///
/// Every node has a kind and three navigation links (parent, previous and next sibling).
/// The links are plain handles into the owning tree and never own anything: ownership flows
/// from composite nodes to their children. Links are maintained exclusively by the tree.
///
/// Nodes are either tokens (leaves with verbatim source text) or composites (nodes with an
/// ordered list of children and a map of named properties).
class SyntaxNode final {
public:
    using PropertyMap = absl::flat_hash_map<std::string, Property>;

    /// A leaf node. Concatenating the text of all tokens in document order
    /// reproduces the source text.
    struct Token final {
        /// The verbatim source text of this token, including any whitespace or comments
        /// attached to it by the lexer.
        std::string text;

        /// Location of the token in the original source. Opaque to the tree.
        SourceRange range;

        Token(std::string text_, const SourceRange& range_)
            : text(std::move(text_))
            , range(range_) {}
    };

    /// A node with children. Children form a doubly linked list from `head` to `tail`.
    struct Composite final {
        SyntaxNodeId head;
        SyntaxNodeId tail;
        u32 child_count = 0;

        /// Named references to children of this node.
        PropertyMap properties;

        Composite() = default;
    };

    static SyntaxNode make_token(SyntaxKind kind, std::string text, const SourceRange& range);
    static SyntaxNode make_composite(SyntaxKind kind);

    ~SyntaxNode();

    SyntaxNode(SyntaxNode&& other) noexcept;
    SyntaxNode& operator=(SyntaxNode&&) = delete;

    SyntaxNodeType type() const noexcept { return type_; }
    bool is_token() const noexcept { return type_ == SyntaxNodeType::Token; }
    bool is_composite() const noexcept { return type_ == SyntaxNodeType::Composite; }

    /// Returns the kind of this node.
    SyntaxKind kind() const { return kind_; }

    /// Returns the parent of this node. Detached nodes and the root have no parent.
    SyntaxNodeId parent() const { return parent_; }

    /// Returns the previous sibling of this node, if any.
    SyntaxNodeId previous() const { return previous_; }

    /// Returns the next sibling of this node, if any.
    SyntaxNodeId next() const { return next_; }

    const Token& as_token() const;
    const Composite& as_composite() const;

    void format(FormatStream& stream) const;

    template<typename Visitor, typename... Args>
    GRAFT_FORCE_INLINE decltype(auto) visit(Visitor&& vis, Args&&... args) const {
        return visit_impl(*this, std::forward<Visitor>(vis), std::forward<Args>(args)...);
    }

private:
    friend SyntaxTree;

    SyntaxNode(SyntaxKind kind, Token token);
    SyntaxNode(SyntaxKind kind, Composite composite);

    Token& as_token();
    Composite& as_composite();

    template<typename Visitor, typename... Args>
    GRAFT_FORCE_INLINE decltype(auto) visit(Visitor&& vis, Args&&... args) {
        return visit_impl(*this, std::forward<Visitor>(vis), std::forward<Args>(args)...);
    }

    void _destroy_value() noexcept;
    void _move_construct_value(SyntaxNode& other) noexcept;

    template<typename Self, typename Visitor, typename... Args>
    static GRAFT_FORCE_INLINE decltype(auto)
    visit_impl(Self&& self, Visitor&& vis, Args&&... args);

private:
    SyntaxNodeType type_;
    SyntaxKind kind_;
    SyntaxNodeId parent_;
    SyntaxNodeId previous_;
    SyntaxNodeId next_;
    union {
        Token token_;
        Composite composite_;
    };
};

template<typename Self, typename Visitor, typename... Args>
decltype(auto) SyntaxNode::visit_impl(Self&& self, Visitor&& vis, Args&&... args) {
    switch (self.type()) {
    case SyntaxNodeType::Token:
        return vis.visit_token(self.token_, std::forward<Args>(args)...);
    case SyntaxNodeType::Composite:
        return vis.visit_composite(self.composite_, std::forward<Args>(args)...);
    }
    GRAFT_UNREACHABLE("Invalid SyntaxNode type.");
}

} // namespace graft

GRAFT_ENABLE_FREE_TO_STRING(graft::SyntaxNodeType)
GRAFT_ENABLE_MEMBER_FORMAT(graft::SyntaxNode)

#endif // GRAFT_SYNTAX_SYNTAX_NODE_HPP
