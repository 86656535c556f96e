#ifndef GRAFT_COMMON_ASSERT_HPP
#define GRAFT_COMMON_ASSERT_HPP

#include "common/debug.hpp"
#include "common/defs.hpp"

namespace graft {

namespace detail {

[[noreturn]] GRAFT_DISABLE_INLINE GRAFT_COLD void
assert_fail(const SourceLocation& loc, const char* cond, const char* message);

[[noreturn]] GRAFT_DISABLE_INLINE GRAFT_COLD void
unreachable(const SourceLocation& loc, const char* message);

} // namespace detail

#ifdef GRAFT_DEBUG

/// When in debug mode, check against the given condition
/// and throw an AssertionFailure if the check fails.
/// Does nothing in release mode.
#    define GRAFT_DEBUG_ASSERT(cond, message)                            \
        do {                                                             \
            if (GRAFT_UNLIKELY(!(cond))) {                               \
                [loc = GRAFT_SOURCE_LOCATION()] {                        \
                    ::graft::detail::assert_fail(loc, #cond, (message)); \
                }();                                                     \
            }                                                            \
        } while (0)

/// Unconditionally terminate the current operation when unreachable code is executed.
#    define GRAFT_UNREACHABLE(message) \
        (::graft::detail::unreachable(GRAFT_SOURCE_LOCATION(), (message)))

#else
#    define GRAFT_DEBUG_ASSERT(cond, message)
#    define GRAFT_UNREACHABLE(message) \
        (::graft::detail::unreachable(GRAFT_SOURCE_LOCATION(), nullptr))
#endif

} // namespace graft

#endif // GRAFT_COMMON_ASSERT_HPP
