#ifndef syntax_hpp
#define syntax_hpp

#include <cstdint> // for std::int64_t
#include <filesystem>
#include <memory> // for std::unique_ptr
#include <optional>
#include <ostream>
#include <string>
#include <utility> // for std::move
#include <vector>

#include "testbed/errors.hpp" // for source_position
#include "testbed/identifier.hpp"
#include "testbed/variant.hpp" // for <variant>, testbed::variant, plus ostream support

/// @brief Parse tree of a configuration.
namespace testbed::syntax {

/// @brief Copyable owner of a single object.
/// @note Allows recursive types within variants.
template <class T>
struct box
{
    box(T v): ptr{std::make_unique<T>(std::move(v))} {}
    box(const box& other): ptr{std::make_unique<T>(*other.ptr)} {}
    box(box&& other) noexcept = default;
    ~box() = default;

    auto operator=(const box& other) -> box&
    {
        if (this != &other) {
            ptr = std::make_unique<T>(*other.ptr);
        }
        return *this;
    }

    auto operator=(box&& other) noexcept -> box& = default;

    auto get() const noexcept -> const T& { return *ptr; }
    auto operator*() const noexcept -> const T& { return *ptr; }
    auto operator->() const noexcept -> const T* { return ptr.get(); }

private:
    std::unique_ptr<T> ptr;
};

struct access;

/// @brief Index of an access step.
/// @note Either a literal or another access chain evaluated at run time.
using index_key = variant<std::int64_t, box<access>>;

struct index_step
{
    index_key key;
};

struct field_step
{
    identifier name;
};

using access_step = variant<index_step, field_step>;

/// @brief Variable access chain like <code>a.b[0].c</code>.
struct access
{
    identifier head;
    std::vector<access_step> steps;
};

auto operator<<(std::ostream& os, const access& value) -> std::ostream&;

/// @brief Part of a string builder: literal text or an interpolation.
using string_part = variant<std::string, access>;

/// @brief Concatenation like <code>"a" + [x] + "b"</code>.
struct string_builder
{
    std::vector<string_part> parts;
};

auto operator<<(std::ostream& os, const string_builder& value)
    -> std::ostream&;

struct integer_literal
{
    std::int64_t value{};
};

/// @brief Endpoint of a range, or a count like a limit or a timeout.
using count = variant<std::int64_t, access>;

struct range_literal
{
    count first;
    count last;
};

struct expression;
struct field_initializer;

struct list_literal
{
    std::vector<expression> elements;
};

struct object_literal
{
    string_builder name;
    std::vector<field_initializer> fields;
};

/// @brief Deep copy, <code>*access</code>.
struct clone
{
    access source;
};

struct load_call
{
    string_builder path;
};

struct build_call
{
    string_builder template_path;
    string_builder output_path;
    std::vector<field_initializer> properties;
};

struct expression
{
    using variant_type = variant<
        string_builder,
        integer_literal,
        range_literal,
        list_literal,
        object_literal,
        access,
        clone,
        load_call,
        build_call
    >;

    variant_type node;
    source_position where;
};

struct field_initializer
{
    identifier name;
    expression value;
};

struct statement;

using block = std::vector<statement>;

enum class assignment_kind { declare, reassign };

/// @brief <code>x = e</code> or <code>x := e</code>.
struct assignment
{
    identifier target;
    assignment_kind kind{assignment_kind::declare};
    expression value;
};

/// @brief <code>access.push(e)</code>.
struct push_statement
{
    access target;
    expression value;
};

struct print_statement
{
    expression value;
};

/// @brief <code>if a, b { ... }</code>, true when every access is true.
struct conditional
{
    std::vector<access> conditions;
    block body;
};

enum class loop_kind { combination, group };

struct loop
{
    loop_kind kind{loop_kind::combination};
    std::vector<identifier> variables;
    std::vector<expression> iterables;
    block body;
};

struct yield_statement
{
    expression value;
};

struct limit_statement
{
    count value;
};

struct sleep_statement
{
    count milliseconds;
};

struct wait_all_statement
{
    std::optional<count> timeout;
};

/// @brief Where a spawned process's output stream goes.
struct output_map
{
    enum class mode { inherit, truncate, append };
    mode how{mode::inherit};
    string_builder path;
};

/// @brief Spawn argument: text, or <code>{access}</code> passing values through.
using argument = variant<string_builder, access>;

struct spawn_statement
{
    std::optional<std::int64_t> id;
    std::optional<string_builder> directory;
    output_map out;
    output_map err;
    string_builder program;
    std::vector<argument> arguments;
};

struct wait_for_statement
{
    count id;
    std::optional<count> timeout;
    std::optional<count> retries;
};

struct kill_statement
{
    count id;
};

struct statement
{
    using variant_type = variant<
        assignment,
        push_statement,
        print_statement,
        conditional,
        loop,
        yield_statement,
        limit_statement,
        sleep_statement,
        wait_all_statement,
        spawn_statement,
        wait_for_statement,
        kill_statement
    >;

    variant_type node;
    source_position where;
};

/// @brief Named sequence of statements like <code>[template.name]</code>.
/// @note The name of the unnamed <code>[commands]</code> block is empty.
struct section
{
    identifier name;
    block body;
    source_position where;
};

struct program
{
    /// @brief Directories searched for templates.
    std::vector<std::filesystem::path> includes;

    /// @brief Base directory for rendered artifacts.
    std::filesystem::path output;

    block globals;
    std::vector<section> templates;
    std::vector<section> commands;
};

}

#endif /* syntax_hpp */
