#ifndef GRAFT_COMMON_DEBUG_HPP
#define GRAFT_COMMON_DEBUG_HPP

namespace graft {

#if !defined(GRAFT_DEBUG) && !defined(NDEBUG)
#    define GRAFT_DEBUG 1
#endif

#ifdef GRAFT_DEBUG
#    define GRAFT_SOURCE_LOCATION() (::graft::SourceLocation{__FILE__, __LINE__, __func__})
#else
#    define GRAFT_SOURCE_LOCATION() (::graft::SourceLocation())
#endif

/// The place in the library's source code where an error or a failed assertion was raised.
struct SourceLocation {
    // All fields are empty in release builds.
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;

    constexpr SourceLocation() = default;

    constexpr SourceLocation(const char* file_, int line_, const char* function_)
        : file(file_)
        , line(line_)
        , function(function_) {}

    explicit constexpr operator bool() const { return file != nullptr; }
};

} // namespace graft

#endif // GRAFT_COMMON_DEBUG_HPP
