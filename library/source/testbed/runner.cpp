#include <algorithm> // for std::find_if
#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move

#include "testbed/executor.hpp"
#include "testbed/runner.hpp"

namespace testbed {

namespace {

auto select(const std::vector<syntax::section>& sections,
            const std::optional<std::vector<std::string>>& names)
    -> std::vector<std::size_t>
{
    auto result = std::vector<std::size_t>{};
    if (!names) {
        for (auto i = std::size_t{}; i < size(sections); ++i) {
            result.push_back(i);
        }
        return result;
    }
    for (auto i = std::size_t{}; i < size(sections); ++i) {
        const auto& name = sections[i].name.get();
        if (std::find(begin(*names), end(*names), name) != end(*names)) {
            result.push_back(i);
        }
    }
    for (auto&& name: *names) {
        const auto found = std::find_if(begin(sections), end(sections),
                                        [&name](const syntax::section& s){
            return s.name.get() == name;
        });
        if (found == end(sections)) {
            throw std::invalid_argument{"no such commands block as \"" +
                                        name + "\""};
        }
    }
    return result;
}

auto describe(const syntax::section& s) -> std::string
{
    return s.name.get().empty()? std::string{"commands"}:
        "commands." + s.name.get();
}

}

runner::runner(syntax::program program_, std::ostream& diags_,
               run_options options_)
    : program{std::move(program_)},
      diags{diags_},
      options{std::move(options_)},
      selected{select(program.commands, options.commands)},
      driver{program.includes, options.output.value_or(program.output)},
      pool{options.process_diags? *options.process_diags: diags_,
           scheduler_options{options.poll_interval}}
{
    // Intentionally empty.
}

auto runner::run() -> void
{
    run_globals();
    run_templates();
    run_commands();
    pool.finish();
}

auto runner::run_globals() -> void
{
    executor{env, diags}.execute(program.globals);
}

auto runner::run_templates() -> void
{
    for (auto&& section: program.templates) {
        env.push_scope();
        driver.start(section.name);
        executor{env, diags, &driver}.execute(section.body);
        env.declare_global(section.name, value{driver.finish()}, true);
    }
}

auto runner::run_commands() -> void
{
    auto& chatter = options.process_diags? *options.process_diags: diags;
    for (auto&& index: selected) {
        const auto& section = program.commands[index];
        chatter << "running " << describe(section) << "\n";
        env.push_scope();
        try {
            executor{env, diags, nullptr, &pool}.execute(section.body);
        }
        catch (...) {
            pool.kill_all();
            throw;
        }
        pool.drain();
    }
}

auto runner::variables() const noexcept -> const environment&
{
    return env;
}

auto runner::processes() const noexcept -> const scheduler&
{
    return pool;
}

}
