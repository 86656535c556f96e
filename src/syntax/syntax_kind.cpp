#include "syntax/syntax_kind.hpp"

#include "common/error.hpp"

#include <absl/strings/string_view.h>

#include <limits>

namespace graft {

SyntaxKindTable::SyntaxKindTable() {}

SyntaxKindTable::~SyntaxKindTable() {}

SyntaxKindTable::SyntaxKindTable(SyntaxKindTable&&) noexcept = default;

SyntaxKindTable& SyntaxKindTable::operator=(SyntaxKindTable&&) noexcept = default;

SyntaxKind SyntaxKindTable::define(std::string_view name, Span<const SyntaxKind> bases) {
    GRAFT_CHECK(!name.empty(), GRAFT_ERROR_BAD_ARG, "Kind names must not be empty.");
    GRAFT_CHECK(!by_name_.contains(absl::string_view(name.data(), name.size())), GRAFT_ERROR_BAD_ARG,
        "A kind with the name '{}' has already been defined.", name);
    GRAFT_CHECK(entries_.size() < SyntaxKind::invalid_value, GRAFT_ERROR_BAD_ARG,
        "Too many syntax kinds.");
    for (const auto& base : bases) {
        GRAFT_CHECK(contains(base), GRAFT_ERROR_BAD_ARG,
            "The base kind {} of '{}' has not been defined.", base, name);
    }

    SyntaxKind kind(static_cast<u16>(entries_.size()));
    auto& entry = entries_.emplace_back();
    entry.name = std::string(name);
    entry.bases.assign(bases.begin(), bases.end());
    by_name_.emplace(entry.name, kind);
    return kind;
}

std::optional<SyntaxKind> SyntaxKindTable::find(std::string_view name) const {
    auto pos = by_name_.find(absl::string_view(name.data(), name.size()));
    if (pos == by_name_.end())
        return {};
    return pos->second;
}

bool SyntaxKindTable::contains(SyntaxKind kind) const {
    return kind && kind.value() < entries_.size();
}

std::string_view SyntaxKindTable::name(SyntaxKind kind) const {
    return entry(kind).name;
}

Span<const SyntaxKind> SyntaxKindTable::bases(SyntaxKind kind) const {
    const auto& bases = entry(kind).bases;
    return {bases.data(), bases.size()};
}

bool SyntaxKindTable::is_a(SyntaxKind kind, SyntaxKind base) const {
    if (kind == base)
        return true;

    // Bases always have smaller ids than the kinds that reference them, so no
    // kind needs to be visited more than once on any path.
    absl::InlinedVector<SyntaxKind, 8> stack;
    for (const auto& b : entry(kind).bases)
        stack.push_back(b);

    while (!stack.empty()) {
        SyntaxKind current = stack.back();
        stack.pop_back();
        if (current == base)
            return true;
        if (current < base)
            continue;

        for (const auto& b : entry(current).bases)
            stack.push_back(b);
    }
    return false;
}

const SyntaxKindTable::Entry& SyntaxKindTable::entry(SyntaxKind kind) const {
    GRAFT_CHECK(contains(kind), GRAFT_ERROR_BAD_ARG, "Unknown syntax kind {}.", kind);
    return entries_[kind.value()];
}

} // namespace graft
