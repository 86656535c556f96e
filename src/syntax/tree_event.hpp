#ifndef GRAFT_SYNTAX_TREE_EVENT_HPP
#define GRAFT_SYNTAX_TREE_EVENT_HPP

#include "common/adt/span.hpp"
#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/format.hpp"
#include "syntax/fwd.hpp"
#include "syntax/source_range.hpp"
#include "syntax/syntax_kind.hpp"

#include <string>

namespace graft {

/// Represents the type of a TreeEvent.
enum class TreeEventType : u8 {
    Start,
    Token,
    Finish,
};

std::string_view to_string(TreeEventType type);

/// TreeEvents are emitted by a parser in order to start and finish composite nodes
/// or to add tokens to the current node.
///
/// Events are a flat stream of values that form an implicit tree structure: every start
/// event is followed by a matching finish event, and all events in between belong to the
/// node that was started.
class TreeEvent final {
public:
    /// Marks the start of a composite node.
    struct Start final {
        /// The node's kind.
        SyntaxKind kind;

        /// Optional property name. When not empty, the node is bound to that property of its parent.
        std::string property;

        /// When true, the property is a list (declared on first use) and the node is appended to it.
        bool list;

        Start(const SyntaxKind& kind_, std::string property_, const bool& list_)
            : kind(kind_)
            , property(std::move(property_))
            , list(list_) {}
    };

    /// Adds a token to the current node.
    struct Token final {
        /// The token's kind.
        SyntaxKind kind;

        /// The verbatim source text of the token.
        std::string text;

        /// The token's location in the source.
        SourceRange range;

        /// Optional property name, see Start::property.
        std::string property;

        /// See Start::list.
        bool list;

        Token(const SyntaxKind& kind_, std::string text_, const SourceRange& range_,
            std::string property_, const bool& list_)
            : kind(kind_)
            , text(std::move(text_))
            , range(range_)
            , property(std::move(property_))
            , list(list_) {}
    };

    /// The finish event ends the current node.
    struct Finish final {};

    static TreeEvent make_start(const SyntaxKind& kind, std::string property = {}, bool list = false);
    static TreeEvent make_token(const SyntaxKind& kind, std::string text, const SourceRange& range = {},
        std::string property = {}, bool list = false);
    static TreeEvent make_finish();

    TreeEvent(Start start);
    TreeEvent(Token token);
    TreeEvent(Finish finish);

    ~TreeEvent();

    TreeEvent(TreeEvent&& other) noexcept;
    TreeEvent& operator=(TreeEvent&& other) noexcept;

    TreeEventType type() const noexcept { return type_; }

    void format(FormatStream& stream) const;

    const Start& as_start() const;
    Start& as_start();

    const Token& as_token() const;
    Token& as_token();

    const Finish& as_finish() const;
    Finish& as_finish();

    template<typename Visitor, typename... Args>
    GRAFT_FORCE_INLINE decltype(auto) visit(Visitor&& vis, Args&&... args) {
        return visit_impl(*this, std::forward<Visitor>(vis), std::forward<Args>(args)...);
    }

    template<typename Visitor, typename... Args>
    GRAFT_FORCE_INLINE decltype(auto) visit(Visitor&& vis, Args&&... args) const {
        return visit_impl(*this, std::forward<Visitor>(vis), std::forward<Args>(args)...);
    }

private:
    void _destroy_value() noexcept;
    void _move_construct_value(TreeEvent& other) noexcept;
    void _move_assign_value(TreeEvent& other) noexcept;

    template<typename Self, typename Visitor, typename... Args>
    static GRAFT_FORCE_INLINE decltype(auto)
    visit_impl(Self&& self, Visitor&& vis, Args&&... args);

private:
    TreeEventType type_;
    union {
        Start start_;
        Token token_;
        Finish finish_;
    };
};

template<typename Self, typename Visitor, typename... Args>
decltype(auto) TreeEvent::visit_impl(Self&& self, Visitor&& vis, Args&&... args) {
    switch (self.type()) {
    case TreeEventType::Start:
        return vis.visit_start(self.start_, std::forward<Args>(args)...);
    case TreeEventType::Token:
        return vis.visit_token(self.token_, std::forward<Args>(args)...);
    case TreeEventType::Finish:
        return vis.visit_finish(self.finish_, std::forward<Args>(args)...);
    }
    GRAFT_UNREACHABLE("Invalid TreeEvent type.");
}

/// Receives the events of an event stream in order.
class TreeEventConsumer {
public:
    virtual ~TreeEventConsumer();

    virtual void start_node(const TreeEvent::Start& start) = 0;
    virtual void token(TreeEvent::Token& token) = 0;
    virtual void finish_node() = 0;
};

/// Feeds all events to the consumer.
/// Token events are passed by mutable reference, consumers may move their contents.
void consume_events(Span<TreeEvent> events, TreeEventConsumer& consumer);

} // namespace graft

GRAFT_ENABLE_FREE_TO_STRING(graft::TreeEventType)
GRAFT_ENABLE_MEMBER_FORMAT(graft::TreeEvent)

#endif // GRAFT_SYNTAX_TREE_EVENT_HPP
