#include "common/assert.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace graft {

// #define GRAFT_ABORT_ON_ASSERT_FAIL

AssertionFailure::AssertionFailure(std::string message)
    : Error(GRAFT_ERROR_INTERNAL, std::move(message)) {}

AssertionFailure::~AssertionFailure() {}

[[noreturn]] static void throw_or_abort(std::string message) {
#ifdef GRAFT_ABORT_ON_ASSERT_FAIL
    fmt::print(stderr, "{}\n", message);
    std::fflush(stderr);
    std::abort();
#else
    throw AssertionFailure(std::move(message));
#endif
}

namespace detail {

void assert_fail(
    [[maybe_unused]] const SourceLocation& loc, const char* condition, const char* message) {

    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "Assertion `{}` failed", condition);
    if (message && std::strlen(message) > 0) {
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    }

#ifdef GRAFT_DEBUG
    fmt::format_to(std::back_inserter(buf), "\n    (in {}:{})", loc.file, loc.line);
#endif

    throw_or_abort(fmt::to_string(buf));
}

void unreachable([[maybe_unused]] const SourceLocation& loc, const char* message) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "Unreachable code executed");
    if (message && std::strlen(message) > 0) {
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    }

#ifdef GRAFT_DEBUG
    fmt::format_to(std::back_inserter(buf), "\n    (in {}:{})", loc.file, loc.line);
#endif
    throw_or_abort(fmt::to_string(buf));
}

} // namespace detail
} // namespace graft
