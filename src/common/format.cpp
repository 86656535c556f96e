#include "common/format.hpp"

namespace graft {

FormatStream::FormatStream() {}

FormatStream::~FormatStream() {}

StringFormatStream::StringFormatStream(size_t initial_capacity) {
    buffer_.reserve(initial_capacity);
}

StringFormatStream::~StringFormatStream() {}

std::string StringFormatStream::take_str() {
    std::string result = std::move(buffer_);
    buffer_.clear();
    return result;
}

void StringFormatStream::do_vformat(std::string_view format, fmt::format_args args) {
    fmt::vformat_to(std::back_inserter(buffer_), format, args);
}

} // namespace graft
