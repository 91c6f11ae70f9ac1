#include <chrono>
#include <cstddef> // for std::size_t
#include <functional> // for std::function
#include <optional>
#include <string>
#include <utility> // for std::move
#include <vector>

#include "testbed/errors.hpp"
#include "testbed/executor.hpp"
#include "testbed/scheduler.hpp"
#include "testbed/template_driver.hpp"

namespace testbed {

namespace {

/// @brief One iterable of a loop.
/// @note Access chain iterables are walked through an alias to their
///   storage, anything else through a value of its own.
struct iteration_source
{
    std::optional<alias> origin;
    value owned;
    std::size_t length{};
};

auto length_of(const value& v) -> std::size_t
{
    if (const auto p = std::get_if<list>(&v.data)) {
        return size(*p);
    }
    if (const auto p = std::get_if<range>(&v.data)) {
        return p->size();
    }
    throw type_mismatch{"cannot iterate over " + std::string(type_name(v))};
}

auto make_source(const evaluator& eval, const syntax::expression& e)
    -> iteration_source
{
    auto result = iteration_source{};
    auto evaluated = eval.evaluate(e);
    if (const auto p = std::get_if<alias>(&evaluated)) {
        result.length = length_of(*eval.variables().resolve(*p));
        result.origin = std::move(*p);
    }
    else {
        result.owned = std::move(std::get<value>(evaluated));
        result.length = length_of(result.owned);
    }
    return result;
}

auto element(const iteration_source& source, std::size_t pos)
    -> variant<value, alias>
{
    if (source.origin) {
        auto result = *source.origin;
        result.path.emplace_back(pos);
        return result;
    }
    if (const auto p = std::get_if<list>(&source.owned.data)) {
        return (*p)[pos];
    }
    return value{std::get<range>(source.owned.data).at(pos)};
}

auto non_negative(std::int64_t n, const char* what) -> std::int64_t
{
    if (n < 0) {
        throw type_mismatch{std::string(what) + " must not be negative, not " +
                            std::to_string(n)};
    }
    return n;
}

auto to_milliseconds(const evaluator& eval, const syntax::count& c,
                     const char* what) -> std::chrono::milliseconds
{
    return std::chrono::milliseconds{non_negative(eval.evaluate_count(c), what)};
}

auto to_redirection(const evaluator& eval, const syntax::output_map& map)
    -> std::optional<redirection>
{
    switch (map.how) {
    case syntax::output_map::mode::inherit:
        break;
    case syntax::output_map::mode::truncate:
        return redirection{eval.stringify(map.path), open_mode::truncate};
    case syntax::output_map::mode::append:
        return redirection{eval.stringify(map.path), open_mode::append};
    }
    return {};
}

auto append_arguments(std::vector<std::string>& args, const value& v) -> void
{
    if (const auto p = std::get_if<list>(&v.data)) {
        for (auto&& element: *p) {
            args.push_back(to_string(element));
        }
        return;
    }
    if (const auto p = std::get_if<range>(&v.data)) {
        for (auto pos = std::size_t{}; pos < p->size(); ++pos) {
            args.push_back(std::to_string(p->at(pos)));
        }
        return;
    }
    args.push_back(to_string(v));
}

auto combine(const std::vector<iteration_source>& sources,
             std::vector<std::size_t>& positions,
             std::size_t level,
             const std::function<void()>& body) -> void
{
    if (level == size(sources)) {
        body();
        return;
    }
    for (auto pos = std::size_t{}; pos < sources[level].length; ++pos) {
        positions[level] = pos;
        combine(sources, positions, level + 1u, body);
    }
}

}

executor::executor(environment& env_, std::ostream& diags_,
                   template_driver* templates_, scheduler* processes_)
    : env{env_},
      diags{diags_},
      templates{templates_},
      processes{processes_},
      eval{env_, templates_}
{
    // Intentionally empty.
}

auto executor::execute(const syntax::block& statements) -> void
{
    for (auto&& s: statements) {
        execute(s);
    }
}

auto executor::execute(const syntax::statement& s) -> void
{
    try {
        std::visit(detail::overloaded{
            [this](const syntax::assignment& node) {
                auto target = eval.evaluate(node.value);
                if (node.kind == syntax::assignment_kind::declare) {
                    env.declare(node.target, std::move(target));
                }
                else {
                    env.reassign(node.target, std::move(target));
                }
            },
            [this](const syntax::push_statement& node) {
                auto v = eval.evaluate_value(node.value);
                auto& storage = env.storage(node.target.head,
                                            eval.path(node.target));
                const auto p = std::get_if<list>(&storage.data);
                if (!p) {
                    throw type_mismatch{"cannot push onto " +
                                        std::string(type_name(storage))};
                }
                p->push_back(std::move(v));
            },
            [this](const syntax::print_statement& node) {
                const auto v = eval.evaluate_value(node.value);
                if (const auto p = std::get_if<std::string>(&v.data)) {
                    diags << *p << "\n";
                }
                else {
                    diags << v << "\n";
                }
            },
            [this](const syntax::conditional& node) {
                for (auto&& condition: node.conditions) {
                    if (!eval.is_true(condition)) {
                        return;
                    }
                }
                const scope_guard guard{env};
                execute(node.body);
            },
            [this](const syntax::loop& node) {
                execute(node);
            },
            [this](const syntax::yield_statement& node) {
                require_driver().yield(eval.evaluate_value(node.value));
            },
            [this](const syntax::limit_statement& node) {
                const auto n = non_negative(eval.evaluate_count(node.value),
                                            "limit");
                require_scheduler().limit(static_cast<std::size_t>(n));
            },
            [this](const syntax::sleep_statement& node) {
                require_scheduler().sleep(to_milliseconds(eval,
                                                          node.milliseconds,
                                                          "sleep"));
            },
            [this](const syntax::wait_all_statement& node) {
                auto timeout = std::optional<std::chrono::milliseconds>{};
                if (node.timeout) {
                    timeout = to_milliseconds(eval, *node.timeout, "timeout");
                }
                // A timeout is reported by the scheduler and isn't fatal.
                require_scheduler().wait_all(timeout);
            },
            [this](const syntax::spawn_statement& node) {
                execute(node);
            },
            [this](const syntax::wait_for_statement& node) {
                auto& pool = require_scheduler();
                const auto id = eval.evaluate_count(node.id);
                auto timeout = std::optional<std::chrono::milliseconds>{};
                if (node.timeout) {
                    timeout = to_milliseconds(eval, *node.timeout, "timeout");
                }
                auto attempts = std::size_t{1u};
                if (node.retries) {
                    attempts = static_cast<std::size_t>(
                        non_negative(eval.evaluate_count(*node.retries),
                                     "retries"));
                }
                // A timeout is reported by the scheduler and isn't fatal.
                pool.wait_for(id, timeout, attempts);
            },
            [this](const syntax::kill_statement& node) {
                require_scheduler().kill(eval.evaluate_count(node.id));
            },
        }, s.node);
    }
    catch (run_error& ex) {
        ex.locate(s.where);
        throw;
    }
}

auto executor::execute(const syntax::loop& l) -> void
{
    auto sources = std::vector<iteration_source>{};
    for (auto&& iterable: l.iterables) {
        sources.push_back(make_source(eval, iterable));
    }
    const auto run_body = [&](const std::vector<std::size_t>& positions) {
        const scope_guard guard{env};
        for (auto i = std::size_t{}; i < size(l.variables); ++i) {
            env.declare(l.variables[i], element(sources[i], positions[i]));
        }
        execute(l.body);
    };
    auto positions = std::vector<std::size_t>(size(sources));
    if (l.kind == syntax::loop_kind::group) {
        const auto length = sources.empty()? std::size_t{}: sources[0].length;
        for (auto&& source: sources) {
            if (source.length != length) {
                throw shape_mismatch{"group loop over iterables of lengths " +
                                     std::to_string(length) + " and " +
                                     std::to_string(source.length)};
            }
        }
        for (auto pos = std::size_t{}; pos < length; ++pos) {
            positions.assign(size(sources), pos);
            run_body(positions);
        }
        return;
    }
    combine(sources, positions, 0u, [&]{
        run_body(positions);
    });
}

auto executor::execute(const syntax::spawn_statement& s) -> void
{
    auto& pool = require_scheduler();
    auto request = spawn_request{};
    request.program = eval.stringify(s.program);
    if (s.directory) {
        request.working_directory = eval.stringify(*s.directory);
    }
    request.out = to_redirection(eval, s.out);
    request.err = to_redirection(eval, s.err);
    for (auto&& arg: s.arguments) {
        if (const auto p = std::get_if<syntax::string_builder>(&arg)) {
            request.arguments.push_back(eval.stringify(*p));
        }
        else {
            append_arguments(request.arguments,
                             *eval.resolve(std::get<syntax::access>(arg)));
        }
    }
    diags.flush();
    pool.spawn(std::move(request), s.id);
}

auto executor::require_scheduler() const -> scheduler&
{
    if (!processes) {
        throw eval_error{"process statement outside a commands block"};
    }
    return *processes;
}

auto executor::require_driver() const -> template_driver&
{
    if (!templates) {
        throw eval_error{"yield outside a template block"};
    }
    return *templates;
}

}
