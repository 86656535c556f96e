#include "syntax/syntax_tree.hpp"

#include "common/error.hpp"
#include "syntax/verify.hpp"

#include <absl/container/flat_hash_set.h>
#include <absl/strings/string_view.h>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

// #define GRAFT_TRACE_MUTATIONS

#ifdef GRAFT_TRACE_MUTATIONS
#    define GRAFT_TRACE(...) fmt::print(stderr, "graft: " __VA_ARGS__)
#else
#    define GRAFT_TRACE(...)
#endif

namespace graft {

SyntaxTree::SyntaxTree(const SyntaxKindTable& kinds, const TreeOptions& options)
    : kinds_(&kinds)
    , options_(options) {}

SyntaxTree::~SyntaxTree() {}

SyntaxTree::SyntaxTree(SyntaxTree&& other) noexcept
    : kinds_(other.kinds_)
    , options_(other.options_)
    , root_(std::exchange(other.root_, SyntaxNodeId()))
    , nodes_(std::move(other.nodes_))
    , free_(std::move(other.free_))
    , live_count_(std::exchange(other.live_count_, 0)) {
    other.nodes_.clear();
    other.free_.clear();
}

SyntaxTree& SyntaxTree::operator=(SyntaxTree&& other) noexcept {
    if (this != &other) {
        kinds_ = other.kinds_;
        options_ = other.options_;
        root_ = std::exchange(other.root_, SyntaxNodeId());
        nodes_ = std::move(other.nodes_);
        free_ = std::move(other.free_);
        live_count_ = std::exchange(other.live_count_, 0);
        other.nodes_.clear();
        other.free_.clear();
    }
    return *this;
}

void SyntaxTree::root_id(SyntaxNodeId id) {
    if (id) {
        const auto& node = get(id);
        GRAFT_CHECK(!node.parent(), GRAFT_ERROR_ALREADY_ATTACHED,
            "The root {} must not have a parent (has {}).", id, node.parent());
    }
    root_ = id;
}

SyntaxNodeId SyntaxTree::make_token(SyntaxKind kind, std::string text, const SourceRange& range) {
    GRAFT_CHECK(kinds_->contains(kind), GRAFT_ERROR_BAD_ARG, "Unknown syntax kind {}.", kind);
    auto node = SyntaxNode::make_token(kind, std::move(text), range);

    if (!free_.empty()) {
        SyntaxNodeId id = free_.back();
        nodes_[id.value()].emplace(std::move(node));
        free_.pop_back();
        ++live_count_;
        return id;
    }

    GRAFT_CHECK(nodes_.size() < SyntaxNodeId::invalid_value, GRAFT_ERROR_INTERNAL,
        "Too many nodes in syntax tree.");
    SyntaxNodeId id(static_cast<u32>(nodes_.size()));
    nodes_.emplace_back(std::move(node));
    ++live_count_;
    return id;
}

SyntaxNodeId SyntaxTree::make_node(SyntaxKind kind) {
    GRAFT_CHECK(kinds_->contains(kind), GRAFT_ERROR_BAD_ARG, "Unknown syntax kind {}.", kind);
    auto node = SyntaxNode::make_composite(kind);

    if (!free_.empty()) {
        SyntaxNodeId id = free_.back();
        nodes_[id.value()].emplace(std::move(node));
        free_.pop_back();
        ++live_count_;
        return id;
    }

    GRAFT_CHECK(nodes_.size() < SyntaxNodeId::invalid_value, GRAFT_ERROR_INTERNAL,
        "Too many nodes in syntax tree.");
    SyntaxNodeId id(static_cast<u32>(nodes_.size()));
    nodes_.emplace_back(std::move(node));
    ++live_count_;
    return id;
}

void SyntaxTree::discard(SyntaxNodeId node) {
    const auto& data = get(node);
    GRAFT_CHECK(!data.parent(), GRAFT_ERROR_ALREADY_ATTACHED,
        "Node {} must be detached from its parent {} before it can be discarded.", node,
        data.parent());

    std::vector<SyntaxNodeId> subtree;
    walk_preorder(node, [&](SyntaxNodeId id) { subtree.push_back(id); });

    GRAFT_TRACE("discard {} ({} nodes)\n", node, subtree.size());
    free_.reserve(free_.size() + subtree.size());
    for (const auto& id : subtree) {
        nodes_[id.value()].reset();
        free_.push_back(id);
        if (id == root_)
            root_ = SyntaxNodeId();
    }
    live_count_ -= subtree.size();
}

bool SyntaxTree::contains(SyntaxNodeId id) const {
    return id && id.value() < nodes_.size() && nodes_[id.value()].has_value();
}

bool SyntaxTree::is_a(SyntaxNodeId node, SyntaxKind kind) const {
    return kinds_->is_a(get(node).kind(), kind);
}

std::string_view SyntaxTree::text(SyntaxNodeId token) const {
    const auto& data = get(token);
    GRAFT_CHECK(data.is_token(), GRAFT_ERROR_BAD_ARG, "Node {} is not a token.", token);
    return data.as_token().text;
}

u32 SyntaxTree::child_count(SyntaxNodeId node) const {
    const auto& data = get(node);
    return data.is_composite() ? data.as_composite().child_count : 0;
}

SyntaxNodeId SyntaxTree::first(SyntaxNodeId node) const {
    const auto& data = get(node);
    return data.is_composite() ? data.as_composite().head : SyntaxNodeId();
}

SyntaxNodeId SyntaxTree::last(SyntaxNodeId node) const {
    const auto& data = get(node);
    return data.is_composite() ? data.as_composite().tail : SyntaxNodeId();
}

bool SyntaxTree::is_inclusive_ancestor(SyntaxNodeId ancestor, SyntaxNodeId node) const {
    get(ancestor);

    SyntaxNodeId current = node;
    while (current) {
        if (current == ancestor)
            return true;
        current = get(current).parent();
    }
    return false;
}

void SyntaxTree::prepend_child(SyntaxNodeId parent, SyntaxNodeId node) {
    check_insertable(parent, node);
    GRAFT_TRACE("prepend {} to {}\n", node, parent);

    auto head = composite(parent).head;
    if (!head) {
        link_only(parent, node);
    } else {
        link_before(parent, head, node);
    }
    mutated(parent);
}

void SyntaxTree::append_child(SyntaxNodeId parent, SyntaxNodeId node, std::string_view property) {
    check_insertable(parent, node);
    GRAFT_TRACE("append {} to {} (property: '{}')\n", node, parent, property);

    if (!property.empty()) {
        auto& properties = composite(parent).properties;
        auto pos = properties.find(absl::string_view(property.data(), property.size()));
        if (pos != properties.end() && pos->second.type() == PropertyType::List) {
            pos->second.as_list().nodes.push_back(node);
        } else {
            properties.insert_or_assign(std::string(property), Property::make_single(node));
        }
    }

    link_last(parent, node);
    mutated(parent);
}

void SyntaxTree::append_children(SyntaxNodeId parent, Span<const SyntaxNodeId> nodes) {
    composite(parent);

    absl::flat_hash_set<SyntaxNodeId> seen;
    for (const auto& node : nodes) {
        check_insertable(parent, node);
        GRAFT_CHECK(seen.insert(node).second, GRAFT_ERROR_ALREADY_ATTACHED,
            "Node {} occurs more than once in the list of new children.", node);
    }

    GRAFT_TRACE("append {} nodes to {}\n", nodes.size(), parent);
    for (const auto& node : nodes)
        link_last(parent, node);
    mutated(parent);
}

void SyntaxTree::merge_node(SyntaxNodeId target, SyntaxNodeId source) {
    composite(target);
    composite(source);
    GRAFT_CHECK(!is_inclusive_ancestor(source, target), GRAFT_ERROR_SELF_REFERENCE,
        "Cannot merge node {} into {}, which is part of its own subtree.", source, target);
    GRAFT_TRACE("merge {} into {}\n", source, target);

    while (SyntaxNodeId child = composite(source).head) {
        unlink(source, child);
        link_last(target, child);
    }

    auto& source_properties = composite(source).properties;
    auto& target_properties = composite(target).properties;
    for (auto& [name, prop] : source_properties) {
        target_properties.insert_or_assign(name, std::move(prop));
    }
    source_properties.clear();

    mutated(target);
    mutated(source);
}

void SyntaxTree::insert_before(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node) {
    check_child(parent, existing);
    check_insertable(parent, node);
    GRAFT_TRACE("insert {} before {} in {}\n", node, existing, parent);

    link_before(parent, existing, node);
    mutated(parent);
}

void SyntaxTree::insert_after(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node) {
    check_child(parent, existing);
    check_insertable(parent, node);
    GRAFT_TRACE("insert {} after {} in {}\n", node, existing, parent);

    link_after(parent, existing, node);
    mutated(parent);
}

void SyntaxTree::remove_child(SyntaxNodeId parent, SyntaxNodeId child) {
    check_child(parent, child);
    GRAFT_TRACE("remove {} from {}\n", child, parent);

    rebind_properties(parent, child, SyntaxNodeId());
    unlink(parent, child);
    mutated(parent);
}

SyntaxNodeId SyntaxTree::remove_first(SyntaxNodeId parent) {
    SyntaxNodeId head = composite(parent).head;
    if (head)
        remove_child(parent, head);
    return head;
}

void SyntaxTree::replace_child(SyntaxNodeId parent, SyntaxNodeId child, SyntaxNodeId replacement) {
    check_child(parent, child);
    check_insertable(parent, replacement);
    GRAFT_TRACE("replace {} with {} in {}\n", child, replacement, parent);

    rebind_properties(parent, child, replacement);

    auto& data = composite(parent);
    auto& old_node = get(child);
    auto& new_node = get(replacement);
    new_node.parent_ = parent;
    new_node.previous_ = old_node.previous_;
    new_node.next_ = old_node.next_;

    if (old_node.previous_) {
        get(old_node.previous_).next_ = replacement;
    } else {
        data.head = replacement;
    }

    if (old_node.next_) {
        get(old_node.next_).previous_ = replacement;
    } else {
        data.tail = replacement;
    }

    old_node.parent_ = SyntaxNodeId();
    old_node.previous_ = SyntaxNodeId();
    old_node.next_ = SyntaxNodeId();
    mutated(parent);
}

void SyntaxTree::detach(SyntaxNodeId node) {
    SyntaxNodeId parent = get(node).parent();
    if (parent)
        remove_child(parent, node);
}

void SyntaxTree::set_property(SyntaxNodeId parent, std::string_view name, SyntaxNodeId child) {
    check_property_name(name);
    check_child(parent, child);

    composite(parent).properties.insert_or_assign(std::string(name), Property::make_single(child));
    mutated(parent);
}

void SyntaxTree::declare_list_property(SyntaxNodeId parent, std::string_view name) {
    check_property_name(name);

    composite(parent).properties.insert_or_assign(std::string(name), Property::make_list({}));
    mutated(parent);
}

void SyntaxTree::clear_property(SyntaxNodeId parent, std::string_view name) {
    composite(parent).properties.erase(absl::string_view(name.data(), name.size()));
    mutated(parent);
}

const Property* SyntaxTree::find_property(SyntaxNodeId parent, std::string_view name) const {
    const auto& data = get(parent);
    if (!data.is_composite())
        return nullptr;

    const auto& properties = data.as_composite().properties;
    auto pos = properties.find(absl::string_view(name.data(), name.size()));
    if (pos == properties.end())
        return nullptr;
    return &pos->second;
}

SyntaxNodeId SyntaxTree::property(SyntaxNodeId parent, std::string_view name) const {
    const Property* prop = find_property(parent, name);
    if (!prop || prop->type() != PropertyType::Single)
        return SyntaxNodeId();
    return prop->as_single().node;
}

Span<const SyntaxNodeId> SyntaxTree::property_list(SyntaxNodeId parent, std::string_view name) const {
    const Property* prop = find_property(parent, name);
    if (!prop || prop->type() != PropertyType::List)
        return {};
    return prop->as_list().nodes;
}

std::vector<std::string_view> SyntaxTree::property_names(SyntaxNodeId parent) const {
    std::vector<std::string_view> names;
    const auto& data = get(parent);
    if (!data.is_composite())
        return names;

    for (const auto& entry : data.as_composite().properties)
        names.push_back(entry.first);
    std::sort(names.begin(), names.end());
    return names;
}

SyntaxNode& SyntaxTree::get(SyntaxNodeId id) {
    return const_cast<SyntaxNode&>(const_cast<const SyntaxTree*>(this)->get(id));
}

const SyntaxNode& SyntaxTree::get(SyntaxNodeId id) const {
    GRAFT_CHECK(contains(id), GRAFT_ERROR_BAD_NODE, "{} does not refer to a live node.", id);
    return *nodes_[id.value()];
}

SyntaxNode::Composite& SyntaxTree::composite(SyntaxNodeId id) {
    return const_cast<SyntaxNode::Composite&>(const_cast<const SyntaxTree*>(this)->composite(id));
}

const SyntaxNode::Composite& SyntaxTree::composite(SyntaxNodeId id) const {
    const auto& data = get(id);
    GRAFT_CHECK(data.is_composite(), GRAFT_ERROR_NOT_COMPOSITE,
        "Node {} is a token and cannot have children.", id);
    return data.as_composite();
}

void SyntaxTree::check_insertable(SyntaxNodeId parent, SyntaxNodeId node) const {
    composite(parent);

    const auto& data = get(node);
    GRAFT_CHECK(!data.parent(), GRAFT_ERROR_ALREADY_ATTACHED,
        "Node {} is already a child of {}.", node, data.parent());
    GRAFT_CHECK(node != root_, GRAFT_ERROR_ALREADY_ATTACHED,
        "Node {} is the root of the tree and cannot become a child of {}.", node, parent);
    GRAFT_CHECK(!is_inclusive_ancestor(node, parent), GRAFT_ERROR_SELF_REFERENCE,
        "Node {} cannot become a child of {}, which is part of its own subtree.", node, parent);
}

void SyntaxTree::check_child(SyntaxNodeId parent, SyntaxNodeId child) const {
    composite(parent);

    const auto& data = get(child);
    GRAFT_CHECK(data.parent() == parent, GRAFT_ERROR_NOT_A_CHILD,
        "Node {} is not a child of {}.", child, parent);
}

void SyntaxTree::check_property_name(std::string_view name) {
    GRAFT_CHECK(!name.empty(), GRAFT_ERROR_BAD_ARG, "Property names must not be empty.");
}

void SyntaxTree::link_only(SyntaxNodeId parent, SyntaxNodeId node) {
    auto& data = composite(parent);
    GRAFT_DEBUG_ASSERT(!data.head && !data.tail, "Parent must not have any children.");

    auto& new_node = get(node);
    new_node.parent_ = parent;
    new_node.previous_ = SyntaxNodeId();
    new_node.next_ = SyntaxNodeId();

    data.head = data.tail = node;
    ++data.child_count;
}

void SyntaxTree::link_before(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node) {
    auto& data = composite(parent);
    auto& existing_node = get(existing);
    auto& new_node = get(node);

    new_node.parent_ = parent;
    new_node.previous_ = existing_node.previous_;
    new_node.next_ = existing;

    if (existing_node.previous_) {
        get(existing_node.previous_).next_ = node;
    } else {
        data.head = node;
    }
    existing_node.previous_ = node;
    ++data.child_count;
}

void SyntaxTree::link_after(SyntaxNodeId parent, SyntaxNodeId existing, SyntaxNodeId node) {
    auto& data = composite(parent);
    auto& existing_node = get(existing);
    auto& new_node = get(node);

    new_node.parent_ = parent;
    new_node.previous_ = existing;
    new_node.next_ = existing_node.next_;

    if (existing_node.next_) {
        get(existing_node.next_).previous_ = node;
    } else {
        data.tail = node;
    }
    existing_node.next_ = node;
    ++data.child_count;
}

void SyntaxTree::link_last(SyntaxNodeId parent, SyntaxNodeId node) {
    auto tail = composite(parent).tail;
    if (!tail) {
        link_only(parent, node);
    } else {
        link_after(parent, tail, node);
    }
}

void SyntaxTree::unlink(SyntaxNodeId parent, SyntaxNodeId child) {
    auto& data = composite(parent);
    auto& old_node = get(child);
    GRAFT_DEBUG_ASSERT(old_node.parent_ == parent, "Node must be a child of the given parent.");

    if (old_node.previous_) {
        get(old_node.previous_).next_ = old_node.next_;
    } else {
        data.head = old_node.next_;
    }

    if (old_node.next_) {
        get(old_node.next_).previous_ = old_node.previous_;
    } else {
        data.tail = old_node.previous_;
    }

    old_node.parent_ = SyntaxNodeId();
    old_node.previous_ = SyntaxNodeId();
    old_node.next_ = SyntaxNodeId();
    --data.child_count;
}

void SyntaxTree::rebind_properties(
    SyntaxNodeId parent, SyntaxNodeId child, SyntaxNodeId replacement) {
    for (auto& entry : composite(parent).properties) {
        [[maybe_unused]] size_t count = entry.second.replace_references(child, replacement);
        GRAFT_TRACE("rebind {} references to {} in property '{}' of {}\n", count, child,
            entry.first, parent);
    }
}

void SyntaxTree::mutated(SyntaxNodeId parent) const {
    if (options_.verify_mutations)
        verify_node(*this, parent);
}

} // namespace graft
