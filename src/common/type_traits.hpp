#ifndef GRAFT_COMMON_TYPE_TRAITS_HPP
#define GRAFT_COMMON_TYPE_TRAITS_HPP

#include <type_traits>

namespace graft {

/// Strips const/volatile and references from T. From c++20.
template<typename T>
struct remove_cvref {
    using type = std::remove_cv_t<std::remove_reference_t<T>>;
};

template<typename T>
using remove_cvref_t = typename remove_cvref<T>::type;

} // namespace graft

#endif // GRAFT_COMMON_TYPE_TRAITS_HPP
