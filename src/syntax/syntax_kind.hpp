#ifndef GRAFT_SYNTAX_SYNTAX_KIND_HPP
#define GRAFT_SYNTAX_SYNTAX_KIND_HPP

#include "common/adt/span.hpp"
#include "common/defs.hpp"
#include "common/format.hpp"
#include "common/id_type.hpp"
#include "syntax/fwd.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/container/inlined_vector.h>

#include <optional>
#include <string>
#include <vector>

namespace graft {

/// Identifies the kind of a syntax node (e.g. "IfStmt" or "Identifier").
/// Kinds are allocated by a SyntaxKindTable.
GRAFT_DEFINE_ID(SyntaxKind, u16)

/// The kind table is the registry of all node kinds known to a grammar.
///
/// Every kind may name a set of base kinds. A kind "is a" base kind if the base
/// is reachable through the base relation; this models both class hierarchies and
/// interface-like capabilities ("IfStmt is a Statement", "FuncDecl is a NameHolder").
/// Bases must be defined before the kinds that refer to them, which keeps the relation acyclic.
///
/// The table must outlive all trees that use its kinds.
class SyntaxKindTable final {
public:
    SyntaxKindTable();
    ~SyntaxKindTable();

    SyntaxKindTable(SyntaxKindTable&&) noexcept;
    SyntaxKindTable& operator=(SyntaxKindTable&&) noexcept;

    SyntaxKindTable(const SyntaxKindTable&) = delete;
    SyntaxKindTable& operator=(const SyntaxKindTable&) = delete;

    /// Defines a new kind with the given (unique) name and base kinds.
    /// Throws `GRAFT_ERROR_BAD_ARG` if the name is empty or already taken, or if
    /// any base kind is unknown.
    SyntaxKind define(std::string_view name, Span<const SyntaxKind> bases = {});

    /// Returns the kind with the given name, if it exists.
    std::optional<SyntaxKind> find(std::string_view name) const;

    /// Returns true if the kind was defined by this table.
    bool contains(SyntaxKind kind) const;

    /// Returns the name of the given kind.
    std::string_view name(SyntaxKind kind) const;

    /// Returns the direct base kinds of the given kind.
    Span<const SyntaxKind> bases(SyntaxKind kind) const;

    /// Returns true if `kind` is equal to `base` or if `base` is (transitively) one
    /// of the bases of `kind`.
    bool is_a(SyntaxKind kind, SyntaxKind base) const;

    /// Number of kinds in this table.
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        absl::InlinedVector<SyntaxKind, 2> bases;
    };

    const Entry& entry(SyntaxKind kind) const;

private:
    std::vector<Entry> entries_;
    absl::flat_hash_map<std::string, SyntaxKind> by_name_;
};

} // namespace graft

#endif // GRAFT_SYNTAX_SYNTAX_KIND_HPP
