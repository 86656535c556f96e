#include "syntax/syntax_node.hpp"

#include <new>

namespace graft {

std::string_view to_string(SyntaxNodeType type) {
    switch (type) {
    case SyntaxNodeType::Token:
        return "Token";
    case SyntaxNodeType::Composite:
        return "Composite";
    }
    GRAFT_UNREACHABLE("Invalid SyntaxNodeType.");
}

SyntaxNode SyntaxNode::make_token(SyntaxKind kind, std::string text, const SourceRange& range) {
    return SyntaxNode(kind, Token(std::move(text), range));
}

SyntaxNode SyntaxNode::make_composite(SyntaxKind kind) {
    return SyntaxNode(kind, Composite());
}

SyntaxNode::SyntaxNode(SyntaxKind kind, Token token)
    : type_(SyntaxNodeType::Token)
    , kind_(kind)
    , token_(std::move(token)) {}

SyntaxNode::SyntaxNode(SyntaxKind kind, Composite composite)
    : type_(SyntaxNodeType::Composite)
    , kind_(kind)
    , composite_(std::move(composite)) {}

SyntaxNode::~SyntaxNode() {
    _destroy_value();
}

static_assert(std::is_nothrow_move_constructible_v<SyntaxNode::Token>,
    "Only nothrow movable types are supported in unions.");

SyntaxNode::SyntaxNode(SyntaxNode&& other) noexcept
    : type_(other.type_)
    , kind_(other.kind_)
    , parent_(other.parent_)
    , previous_(other.previous_)
    , next_(other.next_) {
    _move_construct_value(other);
}

const SyntaxNode::Token& SyntaxNode::as_token() const {
    GRAFT_DEBUG_ASSERT(
        type_ == SyntaxNodeType::Token, "Bad member access on SyntaxNode: not a Token.");
    return token_;
}

SyntaxNode::Token& SyntaxNode::as_token() {
    return const_cast<Token&>(const_cast<const SyntaxNode*>(this)->as_token());
}

const SyntaxNode::Composite& SyntaxNode::as_composite() const {
    GRAFT_DEBUG_ASSERT(type_ == SyntaxNodeType::Composite,
        "Bad member access on SyntaxNode: not a Composite.");
    return composite_;
}

SyntaxNode::Composite& SyntaxNode::as_composite() {
    return const_cast<Composite&>(const_cast<const SyntaxNode*>(this)->as_composite());
}

void SyntaxNode::format(FormatStream& stream) const {
    struct FormatVisitor {
        FormatStream& stream;
        SyntaxKind kind;

        void visit_token(const Token& token) {
            stream.format("Token(kind: {}, range: {}, text_size: {})", kind, token.range,
                token.text.size());
        }

        void visit_composite(const Composite& composite) {
            stream.format("Composite(kind: {}, children: {}, properties: {})", kind,
                composite.child_count, composite.properties.size());
        }
    };
    visit(FormatVisitor{stream, kind_});
}

void SyntaxNode::_destroy_value() noexcept {
    struct DestroyVisitor {
        void visit_token(Token& token) { token.~Token(); }

        void visit_composite(Composite& composite) { composite.~Composite(); }
    };
    visit(DestroyVisitor{});
}

void SyntaxNode::_move_construct_value(SyntaxNode& other) noexcept {
    struct ConstructVisitor {
        SyntaxNode* self;

        void visit_token(Token& token) { new (&self->token_) Token(std::move(token)); }

        void visit_composite(Composite& composite) {
            new (&self->composite_) Composite(std::move(composite));
        }
    };
    other.visit(ConstructVisitor{this});
}

} // namespace graft
