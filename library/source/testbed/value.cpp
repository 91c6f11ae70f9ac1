#include <algorithm> // for std::find_if
#include <charconv> // for std::from_chars
#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream

#include "testbed/errors.hpp"
#include "testbed/value.hpp"

namespace testbed {

namespace {

auto write(std::ostream& os, const field_list& fields) -> std::ostream&
{
    os << "{";
    auto prefix = " ";
    for (auto&& f: fields) {
        os << prefix << f;
        prefix = ", ";
    }
    os << (fields.empty()? "}": " }");
    return os;
}

}

auto operator==(const structure& lhs, const structure& rhs) -> bool
{
    return (lhs.name == rhs.name) && (lhs.fields == rhs.fields);
}

auto operator==(const artifact& lhs, const artifact& rhs) -> bool
{
    return (lhs.source_path == rhs.source_path)
        && (lhs.output_path == rhs.output_path)
        && (lhs.properties == rhs.properties);
}

auto operator==(const range& lhs, const range& rhs) noexcept -> bool
{
    return (lhs.first == rhs.first) && (lhs.last == rhs.last);
}

auto operator==(const value& lhs, const value& rhs) -> bool
{
    return lhs.data == rhs.data;
}

auto operator==(const field& lhs, const field& rhs) -> bool
{
    return (lhs.name == rhs.name) && (lhs.data == rhs.data);
}

auto operator<<(std::ostream& os, const structure& value) -> std::ostream&
{
    os << std::quoted(value.name) << " ";
    return write(os, value.fields);
}

auto operator<<(std::ostream& os, const artifact& value) -> std::ostream&
{
    os << "build(" << std::quoted(value.source_path);
    os << ", " << std::quoted(value.output_path);
    for (auto&& f: value.properties) {
        os << ", " << f;
    }
    os << ")";
    return os;
}

auto operator<<(std::ostream& os, const range& value) -> std::ostream&
{
    os << value.first << ".." << value.last;
    return os;
}

auto operator<<(std::ostream& os, const value& value) -> std::ostream&
{
    std::visit(detail::overloaded{
        [&os](const std::string& v) {
            os << std::quoted(v);
        },
        [&os](std::int64_t v) {
            os << v;
        },
        [&os](bool v) {
            os << std::boolalpha << v;
        },
        [&os](const list& v) {
            os << "[";
            auto prefix = "";
            for (auto&& element: v) {
                os << prefix << element;
                prefix = ", ";
            }
            os << "]";
        },
        [&os](const auto& v) {
            os << v;
        },
    }, value.data);
    return os;
}

auto operator<<(std::ostream& os, const field& value) -> std::ostream&
{
    os << value.name << " = " << value.data;
    return os;
}

auto type_name(const value& v) noexcept -> std::string_view
{
    return std::visit(detail::overloaded{
        [](const std::string&) noexcept { return std::string_view{"string"}; },
        [](std::int64_t) noexcept { return std::string_view{"integer"}; },
        [](bool) noexcept { return std::string_view{"boolean"}; },
        [](const list&) noexcept { return std::string_view{"list"}; },
        [](const structure&) noexcept { return std::string_view{"structure"}; },
        [](const artifact&) noexcept { return std::string_view{"artifact"}; },
        [](const range&) noexcept { return std::string_view{"range"}; },
    }, v.data);
}

auto to_string(const value& v) -> std::string
{
    return std::visit(detail::overloaded{
        [](const std::string& v) {
            return v;
        },
        [](std::int64_t v) {
            return std::to_string(v);
        },
        [](bool v) {
            return std::string{v? "true": "false"};
        },
        [](const structure& v) {
            return v.name;
        },
        [](const artifact& v) {
            return v.output_path;
        },
        [&v](const auto&) -> std::string {
            std::ostringstream os;
            os << "cannot convert " << type_name(v) << " " << v;
            os << " to a string";
            throw type_mismatch{os.str()};
        },
    }, v.data);
}

auto to_integer(const value& v) -> std::int64_t
{
    if (const auto p = std::get_if<std::int64_t>(&v.data)) {
        return *p;
    }
    if (const auto p = std::get_if<std::string>(&v.data)) {
        auto result = std::int64_t{};
        const auto first = p->data();
        const auto last = first + p->size();
        const auto [ptr, ec] = std::from_chars(first, last, result);
        if (!p->empty() && ec == std::errc{} && ptr == last) {
            return result;
        }
    }
    std::ostringstream os;
    os << "expected an integer, found " << type_name(v) << " " << v;
    throw type_mismatch{os.str()};
}

auto find(const field_list& fields, const identifier& name) noexcept
    -> const value*
{
    const auto it = std::find_if(begin(fields), end(fields),
                                 [&name](const field& f){
        return f.name == name;
    });
    return (it != end(fields))? &(it->data): nullptr;
}

auto find(field_list& fields, const identifier& name) noexcept
    -> value*
{
    const auto it = std::find_if(begin(fields), end(fields),
                                 [&name](const field& f){
        return f.name == name;
    });
    return (it != end(fields))? &(it->data): nullptr;
}

}
