#ifndef variant_hpp
#define variant_hpp

#include <ostream>
#include <variant>

namespace testbed {

/// @brief Variant type.
/// @note Use this alias instead of <code>std::variant</code> directly to
/// support output streaming within the same namespace as the testbed object
/// to be streamed.
using std::variant;

template<class... Ts>
auto operator<<(std::ostream& os, const variant<Ts...>& sv) -> std::ostream&
{
    std::visit([&os](const auto& v) { os << v; }, sv);
    return os;
}

namespace detail {

/// @brief Overload set for use with <code>std::visit</code>.
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}

}

#endif /* variant_hpp */
