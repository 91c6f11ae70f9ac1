#include <set>
#include <sstream> // for std::ostringstream

#include "testbed/environment.hpp"
#include "testbed/errors.hpp"

namespace testbed {

namespace {

auto to_field_view(const value_view& from, const value& v) -> value_view
{
    if (from.is_borrowed()) {
        return value_view{v};
    }
    return value_view{value{v}};
}

auto builtin_field(const artifact& a, const identifier& name)
    -> std::optional<value>
{
    if (name.get() == "source") {
        return value{a.source_path};
    }
    if (name.get() == "output") {
        return value{a.output_path};
    }
    return {};
}

[[noreturn]]
auto throw_undefined(const identifier& name) -> void
{
    std::ostringstream os;
    os << "undefined variable " << name;
    throw undefined_variable{os.str()};
}

[[noreturn]]
auto throw_cannot_index(const value& v, std::size_t index) -> void
{
    std::ostringstream os;
    os << "cannot index " << type_name(v) << " with [" << index << "]";
    throw type_mismatch{os.str()};
}

[[noreturn]]
auto throw_out_of_range(std::size_t index, std::size_t size) -> void
{
    std::ostringstream os;
    os << "index " << index << " is out of range for size " << size;
    throw index_out_of_range{os.str()};
}

[[noreturn]]
auto throw_field_not_found(const identifier& name, const value& v) -> void
{
    std::ostringstream os;
    os << "no field named " << name << " in " << type_name(v);
    throw field_not_found{os.str()};
}

[[noreturn]]
auto throw_no_fields(const identifier& name, const value& v) -> void
{
    std::ostringstream os;
    os << "cannot access field " << name << " of " << type_name(v);
    throw type_mismatch{os.str()};
}

}

auto operator<<(std::ostream& os, const std::vector<path_step>& path)
    -> std::ostream&
{
    for (auto&& step: path) {
        std::visit(detail::overloaded{
            [&os](std::size_t index) {
                os << "[" << index << "]";
            },
            [&os](const identifier& name) {
                os << "." << name;
            },
        }, step);
    }
    return os;
}

auto operator<<(std::ostream& os, const alias& value) -> std::ostream&
{
    os << value.name << value.path;
    return os;
}

auto descend(value_view from, const path_step& step) -> value_view
{
    const auto& v = from.get();
    return std::visit(detail::overloaded{
        [&](std::size_t index) -> value_view {
            if (const auto p = std::get_if<list>(&v.data)) {
                if (index >= p->size()) {
                    throw_out_of_range(index, p->size());
                }
                return to_field_view(from, (*p)[index]);
            }
            if (const auto p = std::get_if<range>(&v.data)) {
                if (index >= p->size()) {
                    throw_out_of_range(index, p->size());
                }
                return value_view{value{p->at(index)}};
            }
            throw_cannot_index(v, index);
        },
        [&](const identifier& name) -> value_view {
            if (const auto p = std::get_if<structure>(&v.data)) {
                if (const auto found = find(p->fields, name)) {
                    return to_field_view(from, *found);
                }
                throw_field_not_found(name, v);
            }
            if (const auto p = std::get_if<artifact>(&v.data)) {
                if (const auto found = find(p->properties, name)) {
                    return to_field_view(from, *found);
                }
                if (auto builtin = builtin_field(*p, name)) {
                    return value_view{std::move(*builtin)};
                }
                throw_field_not_found(name, v);
            }
            throw_no_fields(name, v);
        },
    }, step);
}

environment::environment(): scopes(1u)
{
    // Intentionally empty.
}

auto environment::push_scope() -> void
{
    scopes.emplace_back();
}

auto environment::pop_scope() noexcept -> void
{
    if (scopes.size() > 1u) {
        scopes.pop_back();
    }
}

auto environment::depth() const noexcept -> std::size_t
{
    return scopes.size();
}

auto environment::refers_to(const alias& a, std::size_t scope_index,
                            const identifier& name) const -> bool
{
    if ((a.scope == scope_index) && (a.name == name)) {
        return true;
    }
    if (a.scope >= scopes.size()) {
        return false;
    }
    const auto& s = scopes[a.scope];
    const auto it = s.find(a.name);
    if (it == s.end()) {
        return false;
    }
    if (const auto p = std::get_if<alias>(&(it->second.target))) {
        return refers_to(*p, scope_index, name);
    }
    return false;
}

auto environment::bind(std::size_t scope_index, const identifier& name,
                       variant<value, alias> target) const
    -> variant<value, alias>
{
    if (const auto p = std::get_if<alias>(&target)) {
        // Bindings may only refer to bindings that live at least as long.
        if ((p->scope > scope_index) || refers_to(*p, scope_index, name)) {
            return resolve(*p).get();
        }
    }
    return target;
}

auto environment::declare(const identifier& name,
                          variant<value, alias> target,
                          bool read_only) -> void
{
    auto& s = scopes.back();
    if (s.find(name) != s.end()) {
        std::ostringstream os;
        os << name << " is already declared in this scope";
        throw redeclaration_error{os.str()};
    }
    auto bound = bind(scopes.size() - 1u, name, std::move(target));
    s.emplace(name, binding{std::move(bound), read_only});
}

auto environment::declare_global(const identifier& name, value v,
                                 bool read_only) -> void
{
    auto& s = scopes.front();
    if (s.find(name) != s.end()) {
        std::ostringstream os;
        os << name << " is already declared in the global scope";
        throw redeclaration_error{os.str()};
    }
    s.emplace(name, binding{std::move(v), read_only});
}

auto environment::reassign(const identifier& name,
                           variant<value, alias> target) -> void
{
    const auto found = find(name);
    if (!found) {
        std::ostringstream os;
        os << "cannot reassign undeclared variable " << name;
        throw undefined_variable{os.str()};
    }
    auto& b = scopes[*found].find(name)->second;
    if (b.read_only) {
        std::ostringstream os;
        os << "cannot reassign read-only variable " << name;
        throw type_mismatch{os.str()};
    }
    b.target = bind(*found, name, std::move(target));
}

auto environment::find(const identifier& name) const noexcept
    -> std::optional<std::size_t>
{
    for (auto i = scopes.size(); i > 0u; --i) {
        if (scopes[i - 1u].find(name) != scopes[i - 1u].end()) {
            return {i - 1u};
        }
    }
    return {};
}

auto environment::make_alias(const identifier& name,
                             std::vector<path_step> path) const -> alias
{
    const auto found = find(name);
    if (!found) {
        throw_undefined(name);
    }
    return alias{*found, name, std::move(path)};
}

auto environment::lookup(const identifier& name) const -> value_view
{
    return resolve(make_alias(name));
}

auto environment::names() const -> std::vector<identifier>
{
    auto seen = std::set<identifier>{};
    auto result = std::vector<identifier>{};
    for (auto i = scopes.size(); i > 0u; --i) {
        for (auto&& entry: scopes[i - 1u]) {
            if (seen.insert(entry.first).second) {
                result.push_back(entry.first);
            }
        }
    }
    return result;
}

auto environment::resolve(const alias& a) const -> value_view
{
    if (a.scope >= scopes.size()) {
        throw_undefined(a.name);
    }
    const auto& s = scopes[a.scope];
    const auto it = s.find(a.name);
    if (it == s.end()) {
        throw_undefined(a.name);
    }
    auto view = std::visit(detail::overloaded{
        [](const value& v) {
            return value_view{v};
        },
        [this](const alias& other) {
            return resolve(other);
        },
    }, it->second.target);
    for (auto&& step: a.path) {
        view = descend(std::move(view), step);
    }
    return view;
}

auto environment::storage(const identifier& name,
                          const std::vector<path_step>& path) -> value&
{
    const auto found = find(name);
    if (!found) {
        throw_undefined(name);
    }
    auto& b = scopes[*found].find(name)->second;
    if (b.read_only) {
        std::ostringstream os;
        os << "cannot modify read-only variable " << name;
        throw type_mismatch{os.str()};
    }
    const auto p = std::get_if<value>(&b.target);
    if (!p) {
        std::ostringstream os;
        os << "cannot modify " << name << " through an alias";
        os << ", clone it with *" << name << " first";
        throw type_mismatch{os.str()};
    }
    auto current = p;
    for (auto&& step: path) {
        current = std::visit(detail::overloaded{
            [current](std::size_t index) -> value* {
                const auto l = std::get_if<list>(&(current->data));
                if (!l) {
                    throw_cannot_index(*current, index);
                }
                if (index >= l->size()) {
                    throw_out_of_range(index, l->size());
                }
                return &(*l)[index];
            },
            [current](const identifier& field_name) -> value* {
                const auto s = std::get_if<structure>(&(current->data));
                if (!s) {
                    throw_no_fields(field_name, *current);
                }
                if (const auto found_field = testbed::find(s->fields, field_name)) {
                    return found_field;
                }
                throw_field_not_found(field_name, *current);
            },
        }, step);
    }
    return *current;
}

}
