#ifndef GRAFT_SYNTAX_PROPERTY_HPP
#define GRAFT_SYNTAX_PROPERTY_HPP

#include "common/adt/span.hpp"
#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/format.hpp"
#include "syntax/syntax_node_id.hpp"

#include <vector>

namespace graft {

/// Represents the type of a Property.
enum class PropertyType : u8 {
    Single,
    List,
};

std::string_view to_string(PropertyType type);

/// A property is a named, non-positional reference from a composite node to some of its children.
/// It is either bound to a single child or to an ordered sequence of children.
class Property final {
public:
    /// A single child. The node id becomes invalid when the child is removed from its parent.
    struct Single final {
        SyntaxNodeId node;

        explicit Single(const SyntaxNodeId& node_)
            : node(node_) {}
    };

    /// An ordered sequence of children. Removed children are erased from the sequence.
    struct List final {
        std::vector<SyntaxNodeId> nodes;

        explicit List(std::vector<SyntaxNodeId> nodes_)
            : nodes(std::move(nodes_)) {}
    };

    static Property make_single(const SyntaxNodeId& node);
    static Property make_list(std::vector<SyntaxNodeId> nodes);

    Property(Single single);
    Property(List list);

    ~Property();

    Property(Property&& other) noexcept;
    Property& operator=(Property&& other) noexcept;

    PropertyType type() const noexcept { return type_; }

    void format(FormatStream& stream) const;

    const Single& as_single() const;
    Single& as_single();

    const List& as_list() const;
    List& as_list();

    /// Returns all (valid) nodes referenced by this property, in order.
    Span<const SyntaxNodeId> nodes() const;

    /// Returns true if this property references the given node.
    bool references(SyntaxNodeId node) const;

    /// Replaces every reference to `node` with `replacement` and returns the number of replaced references.
    /// If `replacement` is invalid, a single value becomes absent and list entries are erased.
    size_t replace_references(SyntaxNodeId node, SyntaxNodeId replacement);

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
    void _move_construct_value(Property& other) noexcept;
    void _move_assign_value(Property& other) noexcept;

    template<typename Self, typename Visitor, typename... Args>
    static GRAFT_FORCE_INLINE decltype(auto)
    visit_impl(Self&& self, Visitor&& vis, Args&&... args);

private:
    PropertyType type_;
    union {
        Single single_;
        List list_;
    };
};

template<typename Self, typename Visitor, typename... Args>
decltype(auto) Property::visit_impl(Self&& self, Visitor&& vis, Args&&... args) {
    switch (self.type()) {
    case PropertyType::Single:
        return vis.visit_single(self.single_, std::forward<Args>(args)...);
    case PropertyType::List:
        return vis.visit_list(self.list_, std::forward<Args>(args)...);
    }
    GRAFT_UNREACHABLE("Invalid Property type.");
}

} // namespace graft

GRAFT_ENABLE_FREE_TO_STRING(graft::PropertyType)
GRAFT_ENABLE_MEMBER_FORMAT(graft::Property)

#endif // GRAFT_SYNTAX_PROPERTY_HPP
