#ifndef GRAFT_COMMON_ERROR_HPP
#define GRAFT_COMMON_ERROR_HPP

#include "common/debug.hpp"
#include "common/defs.hpp"
#include "graft/error.h"

#include <fmt/format.h>

#include <exception>
#include <string>

namespace graft {

namespace detail {

[[noreturn]] GRAFT_DISABLE_INLINE GRAFT_COLD void throw_error_impl(
    const SourceLocation& loc, graft_errc_t code, const char* format, fmt::format_args args);

} // namespace detail

/// Error class thrown by the library when an operation's contract is violated.
/// The tree is left unmodified when an error is thrown by one of its operations.
class Error : public virtual std::exception {
public:
    explicit Error(graft_errc_t code, std::string message);
    virtual ~Error();

    graft_errc_t code() const noexcept;
    virtual const char* what() const noexcept;

private:
    graft_errc_t code_;
    std::string message_;
};

/// Thrown on assertion failure. Most assertions are disabled in release builds.
class AssertionFailure final : public virtual Error {
public:
    explicit AssertionFailure(std::string message);
    ~AssertionFailure();
};

/// Throws an internal error. The arguments to the macro are interpreted like in fmt::format().
#define GRAFT_ERROR(...) \
    (::graft::throw_error(GRAFT_SOURCE_LOCATION(), GRAFT_ERROR_INTERNAL, __VA_ARGS__))

/// Throws an error with the given code. The remaining arguments are interpreted like in fmt::format().
#define GRAFT_ERROR_WITH_CODE(code, ...) \
    (::graft::throw_error(GRAFT_SOURCE_LOCATION(), (code), __VA_ARGS__))

/// Evaluates a condition and, if the condition evaluates to false, throws an error with the given code.
/// All other arguments are passed to GRAFT_ERROR_WITH_CODE().
#define GRAFT_CHECK(cond, code, ...)                  \
    do {                                              \
        if (GRAFT_UNLIKELY(!(cond))) {                \
            GRAFT_ERROR_WITH_CODE((code), __VA_ARGS__); \
        }                                             \
    } while (0)

/// Throws an error with the provided source location.
template<typename... Args>
[[noreturn]] inline GRAFT_COLD void
throw_error(const SourceLocation& loc, graft_errc_t code, const char* format, const Args&... args) {
    detail::throw_error_impl(loc, code, format, fmt::make_format_args(args...));
}

} // namespace graft

#endif // GRAFT_COMMON_ERROR_HPP
