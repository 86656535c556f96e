#include "common/defs.hpp"

#include <climits>
#include <limits>
#include <type_traits>

namespace graft {

static_assert(CHAR_BIT == 8, "Bytes with a size other than 8 bits are not supported.");

// Node handles are stored as u32 and converted to size_t for vector indexing.
static_assert(std::numeric_limits<u32>::max() <= std::numeric_limits<size_t>::max(),
    "size_t must be able to represent all 32 bit node indices.");

} // namespace graft
