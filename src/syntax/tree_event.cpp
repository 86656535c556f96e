#include "syntax/tree_event.hpp"

#include <new>

namespace graft {

std::string_view to_string(TreeEventType type) {
    switch (type) {
    case TreeEventType::Start:
        return "Start";
    case TreeEventType::Token:
        return "Token";
    case TreeEventType::Finish:
        return "Finish";
    }
    GRAFT_UNREACHABLE("Invalid TreeEventType.");
}

TreeEvent TreeEvent::make_start(const SyntaxKind& kind, std::string property, bool list) {
    return {Start{kind, std::move(property), list}};
}

TreeEvent TreeEvent::make_token(const SyntaxKind& kind, std::string text, const SourceRange& range,
    std::string property, bool list) {
    return {Token{kind, std::move(text), range, std::move(property), list}};
}

TreeEvent TreeEvent::make_finish() {
    return {Finish{}};
}

TreeEvent::TreeEvent(Start start)
    : type_(TreeEventType::Start)
    , start_(std::move(start)) {}

TreeEvent::TreeEvent(Token token)
    : type_(TreeEventType::Token)
    , token_(std::move(token)) {}

TreeEvent::TreeEvent(Finish finish)
    : type_(TreeEventType::Finish)
    , finish_(std::move(finish)) {}

TreeEvent::~TreeEvent() {
    _destroy_value();
}

static_assert(std::is_nothrow_move_constructible_v<
                  TreeEvent::Start> && std::is_nothrow_move_assignable_v<TreeEvent::Start>,
    "Only nothrow movable types are supported in unions.");
static_assert(std::is_nothrow_move_constructible_v<
                  TreeEvent::Token> && std::is_nothrow_move_assignable_v<TreeEvent::Token>,
    "Only nothrow movable types are supported in unions.");
static_assert(std::is_nothrow_move_constructible_v<
                  TreeEvent::Finish> && std::is_nothrow_move_assignable_v<TreeEvent::Finish>,
    "Only nothrow movable types are supported in unions.");

TreeEvent::TreeEvent(TreeEvent&& other) noexcept
    : type_(other.type()) {
    _move_construct_value(other);
}

TreeEvent& TreeEvent::operator=(TreeEvent&& other) noexcept {
    GRAFT_DEBUG_ASSERT(this != &other, "Self move assignment is invalid.");
    if (type() == other.type()) {
        _move_assign_value(other);
    } else {
        _destroy_value();
        _move_construct_value(other);
        type_ = other.type();
    }
    return *this;
}

const TreeEvent::Start& TreeEvent::as_start() const {
    GRAFT_DEBUG_ASSERT(type_ == TreeEventType::Start, "Bad member access on TreeEvent: not a Start.");
    return start_;
}

TreeEvent::Start& TreeEvent::as_start() {
    return const_cast<Start&>(const_cast<const TreeEvent*>(this)->as_start());
}

const TreeEvent::Token& TreeEvent::as_token() const {
    GRAFT_DEBUG_ASSERT(type_ == TreeEventType::Token, "Bad member access on TreeEvent: not a Token.");
    return token_;
}

TreeEvent::Token& TreeEvent::as_token() {
    return const_cast<Token&>(const_cast<const TreeEvent*>(this)->as_token());
}

const TreeEvent::Finish& TreeEvent::as_finish() const {
    GRAFT_DEBUG_ASSERT(
        type_ == TreeEventType::Finish, "Bad member access on TreeEvent: not a Finish.");
    return finish_;
}

TreeEvent::Finish& TreeEvent::as_finish() {
    return const_cast<Finish&>(const_cast<const TreeEvent*>(this)->as_finish());
}

void TreeEvent::format(FormatStream& stream) const {
    struct FormatVisitor {
        FormatStream& stream;

        void visit_start(const Start& start) {
            stream.format("Start(kind: {}, property: \"{}\", list: {})", start.kind, start.property,
                start.list);
        }

        void visit_token(const Token& token) {
            stream.format("Token(kind: {}, text: \"{}\", range: {}, property: \"{}\", list: {})",
                token.kind, token.text, token.range, token.property, token.list);
        }

        void visit_finish([[maybe_unused]] const Finish& finish) { stream.format("Finish"); }
    };
    visit(FormatVisitor{stream});
}

void TreeEvent::_destroy_value() noexcept {
    struct DestroyVisitor {
        void visit_start(Start& start) { start.~Start(); }
        void visit_token(Token& token) { token.~Token(); }
        void visit_finish(Finish& finish) { finish.~Finish(); }
    };
    visit(DestroyVisitor{});
}

void TreeEvent::_move_construct_value(TreeEvent& other) noexcept {
    struct ConstructVisitor {
        TreeEvent* self;

        void visit_start(Start& start) { new (&self->start_) Start(std::move(start)); }
        void visit_token(Token& token) { new (&self->token_) Token(std::move(token)); }
        void visit_finish(Finish& finish) { new (&self->finish_) Finish(std::move(finish)); }
    };
    other.visit(ConstructVisitor{this});
}

void TreeEvent::_move_assign_value(TreeEvent& other) noexcept {
    struct AssignVisitor {
        TreeEvent* self;

        void visit_start(Start& start) { self->start_ = std::move(start); }
        void visit_token(Token& token) { self->token_ = std::move(token); }
        void visit_finish(Finish& finish) { self->finish_ = std::move(finish); }
    };
    other.visit(AssignVisitor{this});
}

TreeEventConsumer::~TreeEventConsumer() {}

void consume_events(Span<TreeEvent> events, TreeEventConsumer& consumer) {
    struct EventVisitor final {
        TreeEventConsumer& consumer;

        void visit_start(TreeEvent::Start& start) { consumer.start_node(start); }
        void visit_token(TreeEvent::Token& token) { consumer.token(token); }
        void visit_finish(TreeEvent::Finish&) { consumer.finish_node(); }
    };

    EventVisitor visitor{consumer};
    for (auto& event : events) {
        event.visit(visitor);
    }
}

} // namespace graft
