#ifndef value_hpp
#define value_hpp

#include <cstddef> // for std::size_t
#include <cstdint> // for std::int64_t, std::uint64_t
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "testbed/identifier.hpp"
#include "testbed/variant.hpp" // for <variant>, testbed::variant, plus ostream support

namespace testbed {

struct value;
struct field;

using list = std::vector<value>;
using field_list = std::vector<field>;

/// @brief Named structure of fields.
/// @note Fields keep their insertion order.
struct structure
{
    std::string name;
    field_list fields;
};

/// @brief Result of rendering a template.
struct artifact
{
    /// @brief Path of the template that was rendered.
    std::string source_path;

    /// @brief Path of the file that was written.
    std::string output_path;

    field_list properties;
};

/// @brief Half-open sequence of integers.
/// @note Includes <code>first</code> and excludes <code>last</code>.
///   Descends when <code>first</code> is greater than <code>last</code>.
struct range
{
    std::int64_t first{};
    std::int64_t last{};

    // Distances can exceed the signed maximum so are computed unsigned.
    [[nodiscard]] constexpr auto size() const noexcept -> std::size_t
    {
        const auto lo = static_cast<std::uint64_t>(first);
        const auto hi = static_cast<std::uint64_t>(last);
        return static_cast<std::size_t>((first <= last)? hi - lo: lo - hi);
    }

    [[nodiscard]] constexpr auto at(std::size_t pos) const noexcept
        -> std::int64_t
    {
        const auto base = static_cast<std::uint64_t>(first);
        const auto offset = static_cast<std::uint64_t>(pos);
        return static_cast<std::int64_t>((first <= last)? base + offset: base - offset);
    }
};

struct value
{
    using variant_type = variant<
        std::string,
        std::int64_t,
        bool,
        list,
        structure,
        artifact,
        range
    >;

    value() = default;
    value(std::string v): data{std::move(v)} {}
    value(const char *v): data{std::string(v)} {}
    value(std::int64_t v): data{v} {}
    value(int v): data{std::int64_t{v}} {}
    value(bool v): data{v} {}
    value(list v): data{std::move(v)} {}
    value(structure v): data{std::move(v)} {}
    value(artifact v): data{std::move(v)} {}
    value(range v): data{v} {}

    variant_type data;
};

/// @brief Named value within a structure or an artifact.
struct field
{
    identifier name;
    value data;
};

auto operator==(const structure& lhs, const structure& rhs) -> bool;
auto operator==(const artifact& lhs, const artifact& rhs) -> bool;
auto operator==(const range& lhs, const range& rhs) noexcept -> bool;
auto operator==(const value& lhs, const value& rhs) -> bool;
auto operator==(const field& lhs, const field& rhs) -> bool;

auto operator<<(std::ostream& os, const structure& value) -> std::ostream&;
auto operator<<(std::ostream& os, const artifact& value) -> std::ostream&;
auto operator<<(std::ostream& os, const range& value) -> std::ostream&;
auto operator<<(std::ostream& os, const value& value) -> std::ostream&;
auto operator<<(std::ostream& os, const field& value) -> std::ostream&;

/// @brief Name of the kind of value held.
auto type_name(const value& v) noexcept -> std::string_view;

/// @brief Textual form of the given value.
/// @throws type_mismatch if the value is a list or a range.
auto to_string(const value& v) -> std::string;

/// @brief Integer form of the given value.
/// @note Strings holding a decimal integer are accepted.
/// @throws type_mismatch if the value has no integer form.
auto to_integer(const value& v) -> std::int64_t;

/// @brief Finds the named field.
/// @return Pointer to the field's value or <code>nullptr</code>.
auto find(const field_list& fields, const identifier& name) noexcept
    -> const value*;

auto find(field_list& fields, const identifier& name) noexcept
    -> value*;

}

#endif /* value_hpp */
