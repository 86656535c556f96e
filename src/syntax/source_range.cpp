#include "syntax/source_range.hpp"

#include "common/error.hpp"

#include <limits>

namespace graft {

SourceRange SourceRange::from_std_offsets(size_t begin, size_t end) {
    GRAFT_CHECK(begin <= std::numeric_limits<u32>::max(), GRAFT_ERROR_BAD_ARG,
        "Index too large for 32 bit.");
    GRAFT_CHECK(end <= std::numeric_limits<u32>::max(), GRAFT_ERROR_BAD_ARG,
        "Index too large for 32 bit.");
    return SourceRange(static_cast<u32>(begin), static_cast<u32>(end));
}

SourceRange SourceRange::from_offset(u32 offset) {
    return SourceRange(offset, offset);
}

SourceRange::SourceRange(u32 begin, u32 end)
    : begin_(begin)
    , end_(end) {
    GRAFT_CHECK(begin <= end, GRAFT_ERROR_BAD_ARG, "Invalid range: 'begin' must be <= 'end'.");
}

void SourceRange::format(FormatStream& stream) const {
    if (empty()) {
        stream.format("[{}, empty]", begin());
        return;
    }

    stream.format("[{}, {}]", begin(), end());
}

std::string_view substring(std::string_view source, const SourceRange& range) {
    GRAFT_CHECK(range.end() <= source.size(), GRAFT_ERROR_BAD_ARG,
        "Source range {} is out of bounds for a source text of size {}.", range, source.size());
    return source.substr(range.begin(), range.size());
}

} // namespace graft
