#ifndef identifier_hpp
#define identifier_hpp

#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

#include "testbed/checked.hpp"

namespace testbed {

struct invalid_identifier: std::invalid_argument
{
    using invalid_argument::invalid_argument;
};

/// @brief Whether the given character may start an identifier.
constexpr auto is_identifier_start(char c) noexcept -> bool
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c == '_');
}

/// @brief Whether the given character may continue an identifier.
constexpr auto is_identifier_part(char c) noexcept -> bool
{
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

struct identifier_checker
{
    auto operator()() const noexcept -> std::string
    {
        return {};
    }

    /// @throws invalid_identifier if @v is empty or has a character
    ///   that's not allowed.
    auto operator()(std::string v) const -> std::string;

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }
};

/// @brief Name of a variable, field or block.
/// @note A default constructed identifier is empty and names nothing.
using identifier = detail::checked<std::string, identifier_checker>;

auto operator<<(std::ostream& os, const identifier& value) -> std::ostream&;

}

#endif /* identifier_hpp */
