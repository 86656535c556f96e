#ifndef GRAFT_COMMON_DEFS_HPP
#define GRAFT_COMMON_DEFS_HPP

#include <cstddef>
#include <cstdint>

namespace graft {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;

using std::ptrdiff_t;
using std::size_t;

#if defined(__GNUC__) || defined(__clang__)
#    define GRAFT_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#    define GRAFT_FORCE_INLINE inline __attribute__((always_inline))
#    define GRAFT_DISABLE_INLINE __attribute__((noinline))
#    define GRAFT_COLD __attribute__((cold))
#elif defined(_MSC_VER)
#    define GRAFT_UNLIKELY(x) (!!(x))
#    define GRAFT_FORCE_INLINE inline __forceinline
#    define GRAFT_DISABLE_INLINE __declspec(noinline)
#    define GRAFT_COLD
#else
#    define GRAFT_UNLIKELY(x) (x)
#    define GRAFT_FORCE_INLINE inline
#    define GRAFT_DISABLE_INLINE
#    define GRAFT_COLD
#endif

} // namespace graft

#endif // GRAFT_COMMON_DEFS_HPP
