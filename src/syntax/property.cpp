#include "syntax/property.hpp"

#include <algorithm>
#include <new>

namespace graft {

std::string_view to_string(PropertyType type) {
    switch (type) {
    case PropertyType::Single:
        return "Single";
    case PropertyType::List:
        return "List";
    }
    GRAFT_UNREACHABLE("Invalid PropertyType.");
}

Property Property::make_single(const SyntaxNodeId& node) {
    return {Single{node}};
}

Property Property::make_list(std::vector<SyntaxNodeId> nodes) {
    return {List{std::move(nodes)}};
}

Property::Property(Single single)
    : type_(PropertyType::Single)
    , single_(std::move(single)) {}

Property::Property(List list)
    : type_(PropertyType::List)
    , list_(std::move(list)) {}

Property::~Property() {
    _destroy_value();
}

static_assert(std::is_nothrow_move_constructible_v<
                  Property::Single> && std::is_nothrow_move_assignable_v<Property::Single>,
    "Only nothrow movable types are supported in unions.");
static_assert(std::is_nothrow_move_constructible_v<
                  Property::List> && std::is_nothrow_move_assignable_v<Property::List>,
    "Only nothrow movable types are supported in unions.");

Property::Property(Property&& other) noexcept
    : type_(other.type()) {
    _move_construct_value(other);
}

Property& Property::operator=(Property&& other) noexcept {
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

const Property::Single& Property::as_single() const {
    GRAFT_DEBUG_ASSERT(
        type_ == PropertyType::Single, "Bad member access on Property: not a Single.");
    return single_;
}

Property::Single& Property::as_single() {
    return const_cast<Single&>(const_cast<const Property*>(this)->as_single());
}

const Property::List& Property::as_list() const {
    GRAFT_DEBUG_ASSERT(type_ == PropertyType::List, "Bad member access on Property: not a List.");
    return list_;
}

Property::List& Property::as_list() {
    return const_cast<List&>(const_cast<const Property*>(this)->as_list());
}

Span<const SyntaxNodeId> Property::nodes() const {
    struct NodesVisitor {
        Span<const SyntaxNodeId> visit_single(const Single& single) {
            if (!single.node)
                return {};
            return {&single.node, 1};
        }

        Span<const SyntaxNodeId> visit_list(const List& list) { return list.nodes; }
    };
    return visit(NodesVisitor{});
}

bool Property::references(SyntaxNodeId node) const {
    const auto nodes = this->nodes();
    return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
}

size_t Property::replace_references(SyntaxNodeId node, SyntaxNodeId replacement) {
    GRAFT_DEBUG_ASSERT(node, "The node to replace must be valid.");

    struct ReplaceVisitor {
        SyntaxNodeId node;
        SyntaxNodeId replacement;

        size_t visit_single(Single& single) {
            if (single.node != node)
                return 0;
            single.node = replacement;
            return 1;
        }

        size_t visit_list(List& list) {
            auto& nodes = list.nodes;
            if (!replacement) {
                auto pos = std::remove(nodes.begin(), nodes.end(), node);
                size_t removed = static_cast<size_t>(nodes.end() - pos);
                nodes.erase(pos, nodes.end());
                return removed;
            }

            size_t replaced = 0;
            for (auto& entry : nodes) {
                if (entry == node) {
                    entry = replacement;
                    ++replaced;
                }
            }
            return replaced;
        }
    };
    return visit(ReplaceVisitor{node, replacement});
}

void Property::format(FormatStream& stream) const {
    struct FormatVisitor {
        FormatStream& stream;

        void visit_single(const Single& single) { stream.format("Single({})", single.node); }

        void visit_list(const List& list) {
            stream.format("List(");
            bool first = true;
            for (const auto& node : list.nodes) {
                if (!first)
                    stream.format(", ");
                stream.format("{}", node);
                first = false;
            }
            stream.format(")");
        }
    };
    visit(FormatVisitor{stream});
}

void Property::_destroy_value() noexcept {
    struct DestroyVisitor {
        void visit_single(Single& single) { single.~Single(); }

        void visit_list(List& list) { list.~List(); }
    };
    visit(DestroyVisitor{});
}

void Property::_move_construct_value(Property& other) noexcept {
    struct ConstructVisitor {
        Property* self;

        void visit_single(Single& single) { new (&self->single_) Single(std::move(single)); }

        void visit_list(List& list) { new (&self->list_) List(std::move(list)); }
    };
    other.visit(ConstructVisitor{this});
}

void Property::_move_assign_value(Property& other) noexcept {
    struct AssignVisitor {
        Property* self;

        void visit_single(Single& single) { self->single_ = std::move(single); }

        void visit_list(List& list) { self->list_ = std::move(list); }
    };
    other.visit(AssignVisitor{this});
}

} // namespace graft
