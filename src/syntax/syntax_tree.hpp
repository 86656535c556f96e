#ifndef GRAFT_SYNTAX_SYNTAX_TREE_HPP
#define GRAFT_SYNTAX_SYNTAX_TREE_HPP

#include "common/adt/span.hpp"
#include "common/defs.hpp"
#include "common/function_ref.hpp"
#include "syntax/fwd.hpp"
#include "syntax/property.hpp"
#include "syntax/source_range.hpp"
#include "syntax/syntax_kind.hpp"
#include "syntax/syntax_node.hpp"
#include "syntax/syntax_node_id.hpp"

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace graft {

/// Runtime options of a syntax tree.
struct TreeOptions {
    /// When true, the tree verifies the invariants of every composite node touched by a mutation
    /// after the mutation has completed. Violations are reported as internal errors.
#ifdef GRAFT_DEBUG
    bool verify_mutations = true;
#else
    bool verify_mutations = false;
#endif
};

/// A range over the children of a node, in document order.
/// The range is invalidated when the node's children are modified.
class ChildRange final {
public:
    class Iterator final {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = SyntaxNodeId;
        using difference_type = ptrdiff_t;
        using pointer = const SyntaxNodeId*;
        using reference = const SyntaxNodeId&;

        Iterator() = default;

        Iterator(const SyntaxTree* tree, SyntaxNodeId current)
            : tree_(tree)
            , current_(current) {}

        const SyntaxNodeId& operator*() const { return current_; }
        const SyntaxNodeId* operator->() const { return &current_; }

        inline Iterator& operator++();

        Iterator operator++(int) {
            Iterator old = *this;
            ++*this;
            return old;
        }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) {
            return lhs.current_ == rhs.current_;
        }

        friend bool operator!=(const Iterator& lhs, const Iterator& rhs) {
            return lhs.current_ != rhs.current_;
        }

    private:
        const SyntaxTree* tree_ = nullptr;
        SyntaxNodeId current_;
    };

    ChildRange(const SyntaxTree* tree, SyntaxNodeId first)
        : tree_(tree)
        , first_(first) {}

    Iterator begin() const { return Iterator(tree_, first_); }
    Iterator end() const { return Iterator(tree_, SyntaxNodeId()); }

private:
    const SyntaxTree* tree_;
    SyntaxNodeId first_;
};

/// The syntax tree owns all nodes of a concrete syntax tree.
///
/// Nodes live in an arena and are addressed by their SyntaxNodeId. Composite nodes own their
/// children; all other references (parent, siblings and properties) are plain ids used for
/// navigation. Every public mutation validates its arguments before touching any link, so
/// a failed operation (signaled by throwing graft::Error) leaves the tree unchanged.
///
/// Serializing an unmodified tree reproduces the original source text, because every byte
/// of the source is stored in exactly one token.
///
/// Trees are not thread safe.
class SyntaxTree final {
public:
    /// Constructs an empty tree. The kind table must outlive the tree.
    explicit SyntaxTree(const SyntaxKindTable& kinds, const TreeOptions& options = {});
    ~SyntaxTree();

    /// The moved-from tree is left empty.
    SyntaxTree(SyntaxTree&&) noexcept;
    SyntaxTree& operator=(SyntaxTree&&) noexcept;

    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;

    /// Returns the kind table used by this tree.
    const SyntaxKindTable& kinds() const { return *kinds_; }

    /// Returns the options of this tree.
    const TreeOptions& options() const { return options_; }

    /// Returns the id of the root node. The root may be unset (invalid).
    SyntaxNodeId root_id() const { return root_; }

    /// Sets the root node. The node must be live and must not have a parent.
    /// The root cannot be inserted into another node while it is set.
    void root_id(SyntaxNodeId id);

    /// Constructs a new, detached token node and returns its id.
    SyntaxNodeId make_token(SyntaxKind kind, std::string text, const SourceRange& range = {});

    /// Constructs a new, detached composite node without children and returns its id.
    SyntaxNodeId make_node(SyntaxKind kind);

    /// Frees the given detached node and all of its descendants.
    /// Ids of discarded nodes must not be used anymore; their slots will be reused.
    void discard(SyntaxNodeId node);

    /// Returns true if the id refers to a live node of this tree.
    bool contains(SyntaxNodeId id) const;

    /// Returns the number of live nodes.
    size_t size() const { return live_count_; }

    /// Returns the node with the given id.
    /// Throws `GRAFT_ERROR_BAD_NODE` if the id does not refer to a live node.
    const SyntaxNode& operator[](SyntaxNodeId id) const { return get(id); }

    SyntaxKind kind(SyntaxNodeId node) const { return get(node).kind(); }
    bool is_token(SyntaxNodeId node) const { return get(node).is_token(); }
    bool is_composite(SyntaxNodeId node) const { return get(node).is_composite(); }

    /// Returns true if the node's kind is (or derives from) the given kind.
    bool is_a(SyntaxNodeId node, SyntaxKind kind) const;

    /// Returns the verbatim text of a token node.
    std::string_view text(SyntaxNodeId token) const;

    SyntaxNodeId parent(SyntaxNodeId node) const { return get(node).parent(); }
    SyntaxNodeId next(SyntaxNodeId node) const { return get(node).next(); }
    SyntaxNodeId previous(SyntaxNodeId node) const { return get(node).previous(); }

    /// Returns the number of children. Tokens have no children.
    u32 child_count(SyntaxNodeId node) const;

    /// Returns the first child (invalid if there are no children).
    SyntaxNodeId first(SyntaxNodeId node) const;

    /// Returns the last child (invalid if there are no children).
    SyntaxNodeId last(SyntaxNodeId node) const;

    /// Returns a range over the children of the given node.
    ChildRange children(SyntaxNodeId node) const { return ChildRange(this, first(node)); }

    /// Returns true if `ancestor` is equal to `node` or if it is one of node's ancestors.
    bool is_inclusive_ancestor(SyntaxNodeId ancestor, SyntaxNodeId node) const;

    /// Makes `node` the new first child of `parent`.
    void prepend_child(SyntaxNodeId parent, SyntaxNodeId node);

    /// Makes `node` the new last child of `parent`.
    ///
    /// If `property` is not empty, the node is also bound to that property name: if the name is
    /// bound to a list, the node is pushed to the end of the list. Otherwise the name is (re)bound
    /// to the node as a single value.
    void append_child(SyntaxNodeId parent, SyntaxNodeId node, std::string_view property = {});

    /// Appends all nodes in order. Equivalent to repeated calls to append_child() without property names.
    /// All nodes are validated before the first one is appended.
    void append_children(SyntaxNodeId parent, Span<const SyntaxNodeId> nodes);

    /// Moves all children of `source` to the end of `target` (in order) and then moves the property
    /// bindings of `source` to `target`. Bindings of `source` overwrite bindings of `target` with the same name.
    /// `source` ends up with neither children nor properties.
    void merge_node(SyntaxNodeId target, SyntaxNodeId source);

    /// Inserts `node` directly before `existing`, which must be a child of `parent`.
    void insert_before(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node);

    /// Inserts `node` directly after `existing`, which must be a child of `parent`.
    void insert_after(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node);

    /// Removes `child` from `parent`. All property bindings referencing the child are cleared:
    /// single values become absent, list entries are erased.
    /// The removed node becomes detached and may be attached elsewhere or discarded.
    void remove_child(SyntaxNodeId parent, SyntaxNodeId child);

    /// Removes the first child of `parent` and returns it.
    /// Returns an invalid id if `parent` has no children.
    SyntaxNodeId remove_first(SyntaxNodeId parent);

    /// Replaces `child` with `replacement` at the same position. All property bindings referencing
    /// `child` are updated to reference `replacement` instead. `child` becomes detached.
    void replace_child(SyntaxNodeId parent, SyntaxNodeId child, SyntaxNodeId replacement);

    /// Removes the node from its parent. Does nothing if the node has no parent.
    void detach(SyntaxNodeId node);

    /// Binds the property `name` of `parent` to `child`, which must be a child of `parent`.
    void set_property(SyntaxNodeId parent, std::string_view name, SyntaxNodeId child);

    /// Binds the property `name` of `parent` to a new, empty list.
    /// Future calls to append_child() with this property name push to the list.
    void declare_list_property(SyntaxNodeId parent, std::string_view name);

    /// Removes the property binding with the given name. Does nothing if there is no such binding.
    void clear_property(SyntaxNodeId parent, std::string_view name);

    /// Returns the property with the given name or null if there is none.
    const Property* find_property(SyntaxNodeId parent, std::string_view name) const;

    /// Returns the node bound to the single valued property `name`.
    /// Returns an invalid id if there is no such property, if the property was cleared or if it is a list.
    SyntaxNodeId property(SyntaxNodeId parent, std::string_view name) const;

    /// Returns the nodes bound to the list property `name`.
    /// Returns an empty span if there is no such property or if it is not a list.
    Span<const SyntaxNodeId> property_list(SyntaxNodeId parent, std::string_view name) const;

    /// Returns the names of all properties of the given node, sorted by name.
    std::vector<std::string_view> property_names(SyntaxNodeId parent) const;

    /// Returns all direct children whose kind is (or derives from) `kind`, in document order.
    std::vector<SyntaxNodeId> filter(SyntaxNodeId parent, SyntaxKind kind) const;

    /// Returns all direct children whose kind matches the given predicate, in document order.
    std::vector<SyntaxNodeId>
    filter_if(SyntaxNodeId parent, FunctionRef<bool(SyntaxKind)> pred) const;

    /// Returns all nodes in the subtree of `node` (including `node` itself) whose kind is
    /// (or derives from) `kind`. The nodes are returned in pre-order (document order).
    std::vector<SyntaxNodeId> find(SyntaxNodeId node, SyntaxKind kind) const;

    /// Like find(), but matches the node kinds against the given predicate.
    std::vector<SyntaxNodeId> find_if(SyntaxNodeId node, FunctionRef<bool(SyntaxKind)> pred) const;

    /// Returns the leftmost token of the subtree by repeatedly descending into the first child.
    /// Throws `GRAFT_ERROR_EMPTY_SUBTREE` if a composite without children is reached.
    SyntaxNodeId first_token(SyntaxNodeId node) const;

    /// Returns the rightmost token of the subtree by repeatedly descending into the last child.
    /// Throws `GRAFT_ERROR_EMPTY_SUBTREE` if a composite without children is reached.
    SyntaxNodeId last_token(SyntaxNodeId node) const;

    /// Returns the source position of the node, i.e. the range of the first token in its subtree.
    /// Nodes without any tokens report the position of their parent.
    /// Throws `GRAFT_ERROR_EMPTY_SUBTREE` if neither the node nor any of its ancestors contains a token.
    SourceRange source_position(SyntaxNodeId node) const;

    /// Returns the concatenated text of all tokens in the subtree, in document order.
    std::string serialize(SyntaxNodeId node) const;

    /// Appends the concatenated text of all tokens in the subtree to `out`.
    void serialize_to(SyntaxNodeId node, std::string& out) const;

private:
    SyntaxNode& get(SyntaxNodeId id);
    const SyntaxNode& get(SyntaxNodeId id) const;

    // Like get(), but throws if the node is not a composite.
    SyntaxNode::Composite& composite(SyntaxNodeId id);
    const SyntaxNode::Composite& composite(SyntaxNodeId id) const;

    // Throws unless `node` can become a child of `parent`.
    void check_insertable(SyntaxNodeId parent, SyntaxNodeId node) const;

    // Throws unless `child` is a child of `parent`.
    void check_child(SyntaxNodeId parent, SyntaxNodeId child) const;

    // Throws unless `name` is a valid property name.
    static void check_property_name(std::string_view name);

    // Link primitives. Arguments must have been validated.
    void link_only(SyntaxNodeId parent, SyntaxNodeId node);
    void link_before(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node);
    void link_after(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node);
    void link_last(SyntaxNodeId parent, SyntaxNodeId node);
    void unlink(SyntaxNodeId parent, SyntaxNodeId child);

    // Updates all property bindings of `parent` that reference `child`.
    void rebind_properties(SyntaxNodeId parent, SyntaxNodeId child, SyntaxNodeId replacement);

    // Called after every public mutation of the given composite.
    void mutated(SyntaxNodeId parent) const;

    // Returns the first token in document order within the subtree of `node`, skipping
    // composites without children. Returns an invalid id if there is no such token.
    SyntaxNodeId find_first_token(SyntaxNodeId node) const;

    // Visits the subtree rooted at `node` in pre-order. If the callback returns a boolean,
    // the traversal stops as soon as it returns false.
    template<typename Callback>
    void walk_preorder(SyntaxNodeId node, Callback&& callback) const;

private:
    const SyntaxKindTable* kinds_;
    TreeOptions options_;
    SyntaxNodeId root_;
    std::vector<std::optional<SyntaxNode>> nodes_;
    std::vector<SyntaxNodeId> free_;
    size_t live_count_ = 0;
};

template<typename Callback>
void SyntaxTree::walk_preorder(SyntaxNodeId node, Callback&& callback) const {
    SyntaxNodeId current = node;
    while (1) {
        if constexpr (std::is_same_v<decltype(callback(current)), bool>) {
            if (!callback(current))
                return;
        } else {
            callback(current);
        }

        const auto& data = get(current);
        if (data.is_composite() && data.as_composite().head) {
            current = data.as_composite().head;
            continue;
        }

        // Climb up until a node with an unvisited sibling is found. Never leave the subtree.
        while (current != node && !get(current).next())
            current = get(current).parent();
        if (current == node)
            return;
        current = get(current).next();
    }
}

ChildRange::Iterator& ChildRange::Iterator::operator++() {
    GRAFT_DEBUG_ASSERT(tree_ && current_, "Cannot increment an invalid iterator.");
    current_ = tree_->next(current_);
    return *this;
}

} // namespace graft

#endif // GRAFT_SYNTAX_SYNTAX_TREE_HPP
