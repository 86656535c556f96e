#ifndef GRAFT_SYNTAX_SOURCE_RANGE_HPP
#define GRAFT_SYNTAX_SOURCE_RANGE_HPP

#include "common/defs.hpp"
#include "common/format.hpp"

namespace graft {

/// References a contiguous slice of the original source text.
/// The value is opaque to the tree: it is recorded for tokens and reported back
/// by position queries, but never interpreted.
class SourceRange final {
public:
    /// Constructs a source range from the given [begin, end) interval.
    /// Verifies that the indices fit into 32 bits.
    static SourceRange from_std_offsets(size_t begin, size_t end);

    /// Constructs an empty source range at the given position.
    static SourceRange from_offset(u32 offset);

    /// Constructs an empty range at offset 0. Tokens created by transforms usually
    /// carry this value.
    SourceRange() = default;

    /// Constructs a valid source range.
    SourceRange(u32 begin, u32 end);

    /// Start of the referenced source code, inclusive.
    u32 begin() const { return begin_; }

    /// End of the referenced source code, exclusive.
    u32 end() const { return end_; }

    /// True if this range has length 0.
    bool empty() const { return begin_ == end_; }

    /// Number of bytes in this range.
    size_t size() const { return end_ - begin_; }

    void format(FormatStream& stream) const;

private:
    // Byte offsets into the input string. Half open [begin, end).
    u32 begin_ = 0;
    u32 end_ = 0;
};

/// Returns the part of `source` referenced by `range`.
std::string_view substring(std::string_view source, const SourceRange& range);

inline bool operator==(const SourceRange& lhs, const SourceRange& rhs) {
    return lhs.begin() == rhs.begin() && lhs.end() == rhs.end();
}

inline bool operator!=(const SourceRange& lhs, const SourceRange& rhs) {
    return !(lhs == rhs);
}

} // namespace graft

GRAFT_ENABLE_MEMBER_FORMAT(graft::SourceRange)

#endif // GRAFT_SYNTAX_SOURCE_RANGE_HPP
