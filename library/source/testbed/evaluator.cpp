#include <set>
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "testbed/data_loader.hpp"
#include "testbed/errors.hpp"
#include "testbed/evaluator.hpp"
#include "testbed/template_driver.hpp"

namespace testbed {

namespace {

auto to_index(std::int64_t v) -> std::size_t
{
    if (v < 0) {
        std::ostringstream os;
        os << "index " << v << " is out of range";
        throw index_out_of_range{os.str()};
    }
    return static_cast<std::size_t>(v);
}

auto evaluate_fields(const evaluator& eval,
                     const std::vector<syntax::field_initializer>& inits)
    -> field_list
{
    auto result = field_list{};
    auto names = std::set<identifier>{};
    for (auto&& init: inits) {
        if (!names.insert(init.name).second) {
            std::ostringstream os;
            os << "field " << init.name << " is given more than once";
            throw redeclaration_error{os.str()};
        }
        result.push_back(field{init.name, eval.evaluate_value(init.value)});
    }
    return result;
}

}

evaluator::evaluator(environment& e, template_driver* t) noexcept:
    env{e}, templates{t}
{
    // Intentionally empty.
}

auto evaluator::evaluate(const syntax::expression& e) const -> result
{
    return std::visit(detail::overloaded{
        [this](const syntax::string_builder& node) -> result {
            return value{stringify(node)};
        },
        [](const syntax::integer_literal& node) -> result {
            return value{node.value};
        },
        [this](const syntax::range_literal& node) -> result {
            return value{range{evaluate_count(node.first),
                               evaluate_count(node.last)}};
        },
        [this](const syntax::list_literal& node) -> result {
            auto elements = list{};
            for (auto&& element: node.elements) {
                elements.push_back(evaluate_value(element));
            }
            return value{std::move(elements)};
        },
        [this](const syntax::object_literal& node) -> result {
            return value{structure{stringify(node.name),
                                   evaluate_fields(*this, node.fields)}};
        },
        [this](const syntax::access& node) -> result {
            return make_alias(node);
        },
        [this](const syntax::clone& node) -> result {
            return resolve(node.source).get();
        },
        [this](const syntax::load_call& node) -> result {
            return load(stringify(node.path));
        },
        [this](const syntax::build_call& node) -> result {
            if (!templates) {
                throw eval_error{"build is only available in template blocks"};
            }
            return value{templates->build(stringify(node.template_path),
                                          stringify(node.output_path),
                                          evaluate_fields(*this, node.properties),
                                          *this)};
        },
    }, e.node);
}

auto evaluator::evaluate_value(const syntax::expression& e) const -> value
{
    auto r = evaluate(e);
    if (const auto p = std::get_if<alias>(&r)) {
        return env.resolve(*p).get();
    }
    return std::get<value>(std::move(r));
}

auto evaluator::evaluate_count(const syntax::count& c) const -> std::int64_t
{
    return std::visit(detail::overloaded{
        [](std::int64_t v) {
            return v;
        },
        [this](const syntax::access& a) {
            return to_integer(resolve(a).get());
        },
    }, c);
}

auto evaluator::resolve(const syntax::access& a) const -> value_view
{
    auto view = env.lookup(a.head);
    for (auto&& step: path(a)) {
        view = descend(std::move(view), step);
    }
    return view;
}

auto evaluator::make_alias(const syntax::access& a) const -> alias
{
    auto result = env.make_alias(a.head, path(a));
    (void) env.resolve(result);
    return result;
}

auto evaluator::path(const syntax::access& a) const -> std::vector<path_step>
{
    auto result = std::vector<path_step>{};
    for (auto&& step: a.steps) {
        std::visit(detail::overloaded{
            [&result](const syntax::field_step& s) {
                result.emplace_back(s.name);
            },
            [this, &result](const syntax::index_step& s) {
                const auto index = std::visit(detail::overloaded{
                    [](std::int64_t v) {
                        return v;
                    },
                    [this](const syntax::box<syntax::access>& key) {
                        return to_integer(resolve(*key).get());
                    },
                }, s.key);
                result.emplace_back(to_index(index));
            },
        }, step);
    }
    return result;
}

auto evaluator::stringify(const syntax::string_builder& b) const
    -> std::string
{
    auto result = std::string{};
    for (auto&& part: b.parts) {
        std::visit(detail::overloaded{
            [&result](const std::string& s) {
                result += s;
            },
            [this, &result](const syntax::access& a) {
                result += to_string(resolve(a).get());
            },
        }, part);
    }
    return result;
}

auto evaluator::is_true(const syntax::access& a) const -> bool
{
    try {
        const auto view = resolve(a);
        if (const auto p = std::get_if<std::string>(&(view->data))) {
            return *p != "false";
        }
        if (const auto p = std::get_if<bool>(&(view->data))) {
            return *p;
        }
        return true;
    }
    catch (const eval_error&) {
        // Unresolvable accesses are false.
        return false;
    }
}

auto evaluator::variables() const noexcept -> const environment&
{
    return env;
}

}
