#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "testbed/errors.hpp"

namespace testbed {

namespace {

auto make_syntax_message(const source_position& where,
                         const std::string& found,
                         const std::string& expected) -> std::string
{
    std::ostringstream os;
    os << where << ": syntax error: expected " << expected;
    os << ", found " << found;
    return os.str();
}

}

auto operator<<(std::ostream& os, const source_position& value)
    -> std::ostream&
{
    if (!value.origin.empty()) {
        os << value.origin << ":";
    }
    os << value.line << ":" << value.column;
    return os;
}

syntax_error::syntax_error(source_position where,
                           std::string found,
                           std::string expected):
    runtime_error{make_syntax_message(where, found, expected)},
    where_{std::move(where)},
    found_{std::move(found)},
    expected_{std::move(expected)}
{
    // Intentionally empty.
}

auto syntax_error::where() const noexcept -> const source_position&
{
    return where_;
}

auto syntax_error::found() const -> std::string
{
    return found_;
}

auto syntax_error::expected() const -> std::string
{
    return expected_;
}

auto run_error::locate(const source_position& where) -> void
{
    if (where_) {
        return;
    }
    where_ = where;
    std::ostringstream os;
    os << where << ": " << runtime_error::what();
    located_what_ = os.str();
}

auto run_error::where() const noexcept
    -> const std::optional<source_position>&
{
    return where_;
}

auto run_error::what() const noexcept -> const char*
{
    return where_? located_what_.c_str(): runtime_error::what();
}

}
