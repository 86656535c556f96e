#ifndef GRAFT_COMMON_FORMAT_HPP
#define GRAFT_COMMON_FORMAT_HPP

#include "common/defs.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

/// Opt into one of the custom formatting interfaces in order to support user defined
/// types in fmt format strings.
///
/// GRAFT_ENABLE_MEMBER_FORMAT(Type) will opt into the member function interface, i.e. `object.format(FormatStream&)`.
/// GRAFT_ENABLE_FREE_TO_STRING(Type) will use a free to_string function, i.e. `to_string(object)`.
///
/// The macro invocations must be placed in the global namespace.
#define GRAFT_ENABLE_MEMBER_FORMAT(...) \
    GRAFT_ENABLE_FORMAT_MODE_IMPL(GRAFT_SINGLE_ARG(__VA_ARGS__), ::graft::FormatMode::MemberFormat)
#define GRAFT_ENABLE_FREE_TO_STRING(...) \
    GRAFT_ENABLE_FORMAT_MODE_IMPL(GRAFT_SINGLE_ARG(__VA_ARGS__), ::graft::FormatMode::FreeToString)

#define GRAFT_SINGLE_ARG(...) __VA_ARGS__

#define GRAFT_ENABLE_FORMAT_MODE_IMPL(Type, Mode)            \
    template<>                                               \
    struct graft::EnableFormatMode<Type> {                   \
        static constexpr ::graft::FormatMode value = (Mode); \
    };

namespace graft {

enum class FormatMode {
    None,         // Not specialized.
    MemberFormat, // Object has a member function `obj.format(FormatStream&)`.
    FreeToString, // There is a free function `to_string(obj)` that returns a string / string_view / const char*
};

template<typename T, typename Enable = void>
struct EnableFormatMode {
    static constexpr FormatMode value = FormatMode::None;
};

/// Base class for all format streams.
class FormatStream {
public:
    virtual ~FormatStream();

    FormatStream(const FormatStream&) = delete;
    FormatStream& operator=(const FormatStream&) = delete;

public:
    template<typename... Args>
    FormatStream& format(std::string_view format_str, Args&&... args) {
        do_vformat(format_str, fmt::make_format_args(args...));
        return *this;
    }

    FormatStream& vformat(std::string_view format_str, fmt::format_args args) {
        do_vformat(format_str, args);
        return *this;
    }

protected:
    FormatStream();

    virtual void do_vformat(std::string_view format, fmt::format_args args) = 0;
};

/// A stream that outputs all formatted output into a string.
class StringFormatStream final : public FormatStream {
public:
    explicit StringFormatStream(size_t initial_capacity = 0);
    ~StringFormatStream();

    /// Returns the current output string.
    const std::string& str() const { return buffer_; }

    /// Moves the output string out of the stream. The stream's output buffer will become empty.
    std::string take_str();

private:
    void do_vformat(std::string_view format, fmt::format_args args) override;

private:
    std::string buffer_;
};

/// A stream that appends all formatted output to the given output iterator.
template<typename OutputIterator>
class OutputIteratorStream final : public FormatStream {
public:
    explicit OutputIteratorStream(const OutputIterator& out)
        : out_(out) {}

    ~OutputIteratorStream() = default;

    const OutputIterator& out() const { return out_; }

private:
    void do_vformat(std::string_view format, fmt::format_args args) override {
        out_ = fmt::vformat_to(out_, format, args);
    }

private:
    OutputIterator out_;
};

namespace detail {

template<typename T>
inline constexpr bool has_custom_format = EnableFormatMode<T>::value != FormatMode::None;

template<typename T, typename Stream>
void call_member_format(const T& value, Stream&& stream) {
    value.format(stream);
}

template<typename T>
auto call_free_to_string(const T& value) {
    return to_string(value);
}

} // namespace detail
} // namespace graft

template<typename T, typename Char>
struct fmt::formatter<T, Char, std::enable_if_t<graft::detail::has_custom_format<T>>> {

    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const T& value, FormatContext& ctx) const {
        constexpr auto mode = graft::EnableFormatMode<T>::value;
        if constexpr (mode == graft::FormatMode::MemberFormat) {
            graft::OutputIteratorStream stream(ctx.out());
            graft::detail::call_member_format(value, stream);
            return stream.out();
        } else {
            return fmt::format_to(ctx.out(), "{}", graft::detail::call_free_to_string(value));
        }
    }
};

#endif // GRAFT_COMMON_FORMAT_HPP
