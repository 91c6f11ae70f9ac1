#ifndef environment_hpp
#define environment_hpp

#include <cstddef> // for std::size_t
#include <map>
#include <optional>
#include <ostream>
#include <utility> // for std::move
#include <vector>

#include "testbed/identifier.hpp"
#include "testbed/value.hpp"
#include "testbed/variant.hpp" // for <variant>, testbed::variant, plus ostream support

namespace testbed {

/// @brief Resolved step of an access path.
/// @note Either an index into a list or range, or a field name.
using path_step = variant<std::size_t, identifier>;

auto operator<<(std::ostream& os, const std::vector<path_step>& path)
    -> std::ostream&;

/// @brief Reference to the storage of another binding.
/// @note Resolved every time it's used, so it sees later changes.
struct alias
{
    /// @brief Index of the scope holding the referenced binding.
    std::size_t scope{};
    identifier name;
    std::vector<path_step> path;
};

auto operator<<(std::ostream& os, const alias& value) -> std::ostream&;

struct binding
{
    variant<value, alias> target;
    bool read_only{};
};

/// @brief Read-only view of a value.
/// @note Either borrows storage of the environment or owns a temporary,
///   like an element of a range, that has no storage of its own.
class value_view
{
public:
    value_view(const value& v) noexcept: data{&v} {}
    value_view(value&& v): data{std::move(v)} {}

    [[nodiscard]] auto get() const noexcept -> const value&
    {
        if (const auto p = std::get_if<const value*>(&data)) {
            return **p;
        }
        return std::get<value>(data);
    }

    auto operator*() const noexcept -> const value& { return get(); }
    auto operator->() const noexcept -> const value* { return &get(); }

    /// @brief Whether this view borrows environment storage.
    [[nodiscard]] auto is_borrowed() const noexcept -> bool
    {
        return std::holds_alternative<const value*>(data);
    }

private:
    variant<const value*, value> data;
};

/// @brief Narrows the given view by one step.
/// @throws type_mismatch, index_out_of_range, field_not_found.
auto descend(value_view from, const path_step& step) -> value_view;

/// @brief Stack of scopes of bindings.
/// @note Scope 0 is the global scope and always exists.
class environment
{
public:
    using scope = std::map<identifier, binding>;

    environment();

    auto push_scope() -> void;

    /// @note Does nothing if only the global scope remains.
    auto pop_scope() noexcept -> void;

    [[nodiscard]] auto depth() const noexcept -> std::size_t;

    /// @brief Declares a new binding in the innermost scope.
    /// @note An alias into a scope deeper than the innermost one is copied.
    /// @throws redeclaration_error if the innermost scope already binds
    ///   @name.
    auto declare(const identifier& name, variant<value, alias> target,
                 bool read_only = false) -> void;

    /// @brief Declares a new binding in the global scope.
    auto declare_global(const identifier& name, value v,
                        bool read_only = false) -> void;

    /// @brief Rebinds the nearest existing binding of @name.
    /// @throws undefined_variable if nothing binds @name.
    /// @throws type_mismatch if the binding is read-only.
    auto reassign(const identifier& name, variant<value, alias> target)
        -> void;

    /// @brief Index of the scope holding the nearest binding of @name.
    [[nodiscard]] auto find(const identifier& name) const noexcept
        -> std::optional<std::size_t>;

    /// @brief Makes an alias to the nearest binding of @name.
    /// @throws undefined_variable if nothing binds @name.
    [[nodiscard]] auto make_alias(const identifier& name,
                                  std::vector<path_step> path = {}) const
        -> alias;

    [[nodiscard]] auto lookup(const identifier& name) const -> value_view;

    /// @brief Names of all visible bindings.
    /// @note Each name appears once, innermost scope first.
    [[nodiscard]] auto names() const -> std::vector<identifier>;

    [[nodiscard]] auto resolve(const alias& a) const -> value_view;

    /// @brief Writable storage at the given path.
    /// @throws type_mismatch if the path goes through an alias, a
    ///   read-only binding or a range.
    [[nodiscard]] auto storage(const identifier& name,
                               const std::vector<path_step>& path) -> value&;

private:
    auto bind(std::size_t scope_index, const identifier& name,
              variant<value, alias> target) const -> variant<value, alias>;

    [[nodiscard]] auto refers_to(const alias& a, std::size_t scope_index,
                                 const identifier& name) const -> bool;

    std::vector<scope> scopes;
};

/// @brief Scope that is popped when this object is destroyed.
struct scope_guard
{
    explicit scope_guard(environment& e): env{e}
    {
        env.push_scope();
    }

    scope_guard(const scope_guard&) = delete;
    auto operator=(const scope_guard&) -> scope_guard& = delete;

    ~scope_guard()
    {
        env.pop_scope();
    }

private:
    environment& env;
};

}

#endif /* environment_hpp */
