#include "common/error.hpp"

namespace graft {

namespace detail {

void throw_error_impl([[maybe_unused]] const SourceLocation& loc, graft_errc_t code,
    const char* format, fmt::format_args args) {

    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "{}: ", graft_errc_name(code));

#ifdef GRAFT_DEBUG
    if (loc) {
        fmt::format_to(
            std::back_inserter(buf), "in {} ({}:{}): ", loc.function, loc.file, loc.line);
    }
#endif

    fmt::vformat_to(std::back_inserter(buf), format, args);
    throw Error(code, fmt::to_string(buf));
}

} // namespace detail

Error::Error(graft_errc_t code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::~Error() {}

graft_errc_t Error::code() const noexcept {
    return code_;
}

const char* Error::what() const noexcept {
    return message_.c_str();
}

} // namespace graft
