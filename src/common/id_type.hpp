#ifndef GRAFT_COMMON_ID_TYPE_HPP
#define GRAFT_COMMON_ID_TYPE_HPP

#include "common/defs.hpp"
#include "common/format.hpp"

#include <utility>

namespace graft {

struct IdTypeBase {};

/// This class is a type safe wrapper that represents a unique id.
/// It is based around a simple underlying integral type.
/// Even though it is just a wrapper, it helps with compile time safety because
/// it makes it impossible to confuse to what type an id belongs to.
///
/// The value `-1`, casted to the underlying type, is used as an invalid value.
template<typename Underlying, typename Derived>
class IdType : public IdTypeBase {
public:
    using UnderlyingType = Underlying;

    /// The invalid underlying value.
    static constexpr Underlying invalid_value = Underlying(-1);

    /// The invalid id value.
    static const Derived invalid;

    /// Constructs an invalid id.
    constexpr IdType() = default;

    /// Constructs an id that wraps the provided underlying value.
    constexpr explicit IdType(const Underlying& value)
        : value_(value) {}

    constexpr bool valid() const noexcept { return value_ != invalid_value; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    constexpr const Underlying& value() const noexcept { return value_; }

#define GRAFT_ID_COMPARE(op)                                                    \
    friend constexpr bool operator op(const Derived& lhs, const Derived& rhs) { \
        return lhs.value() op rhs.value();                                      \
    }

    GRAFT_ID_COMPARE(==)
    GRAFT_ID_COMPARE(!=)
    GRAFT_ID_COMPARE(<=)
    GRAFT_ID_COMPARE(>=)
    GRAFT_ID_COMPARE(<)
    GRAFT_ID_COMPARE(>)

#undef GRAFT_ID_COMPARE

    template<typename H>
    friend H AbslHashValue(H state, const Derived& id) {
        return H::combine(std::move(state), id.value());
    }

protected:
    void format_name(std::string_view type_name, FormatStream& stream) const {
        if (!valid()) {
            stream.format("{}(invalid)", type_name);
            return;
        }
        stream.format("{}({})", type_name, value());
    }

private:
    Underlying value_ = invalid_value;
};

template<typename Underlying, typename Derived>
const Derived IdType<Underlying, Derived>::invalid{};

#define GRAFT_DEFINE_ID(Name, Underlying)                                                 \
    class Name final : public ::graft::IdType<Underlying, Name> {                         \
    public:                                                                               \
        using IdType::IdType;                                                             \
                                                                                          \
        void format(::graft::FormatStream& stream) const { IdType::format_name(#Name, stream); } \
    };

} // namespace graft

template<typename T>
struct graft::EnableFormatMode<T, std::enable_if_t<std::is_base_of_v<graft::IdTypeBase, T>>> {
    static constexpr graft::FormatMode value = graft::FormatMode::MemberFormat;
};

#endif // GRAFT_COMMON_ID_TYPE_HPP
