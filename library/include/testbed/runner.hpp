#ifndef runner_hpp
#define runner_hpp

#include <chrono>
#include <cstddef> // for std::size_t
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "testbed/environment.hpp"
#include "testbed/scheduler.hpp"
#include "testbed/syntax.hpp"
#include "testbed/template_driver.hpp"

namespace testbed {

struct run_options
{
    /// @brief Names of the commands blocks to run.
    /// @note The empty name selects the unnamed block. Unset runs them all.
    std::optional<std::vector<std::string>> commands;

    /// @brief Overrides the program's output directory if set.
    std::optional<std::filesystem::path> output;

    std::chrono::milliseconds poll_interval{10};

    /// @brief Stream for the scheduler's chatter. Unset for the run's own.
    std::ostream* process_diags{};
};

/// @brief Runs a parsed program: globals, then every template block, then
///   the selected commands blocks.
/// @note Every block gets its own scope that's kept for the rest of the run.
class runner
{
public:
    /// @throws std::invalid_argument if a selected commands block doesn't
    ///   exist.
    runner(syntax::program program, std::ostream& diags,
           run_options options = {});

    auto run() -> void;

    auto run_globals() -> void;

    /// @note Binds each template block's name globally, read-only, to the
    ///   list of values it yielded.
    auto run_templates() -> void;

    /// @note Drains the processes left at the end of each block. If a block
    ///   fails, its live processes are killed before the error propagates.
    auto run_commands() -> void;

    [[nodiscard]] auto variables() const noexcept -> const environment&;

    [[nodiscard]] auto processes() const noexcept -> const scheduler&;

private:
    syntax::program program;
    std::ostream& diags;
    run_options options;
    std::vector<std::size_t> selected;
    environment env;
    template_driver driver;
    scheduler pool;
};

}

#endif /* runner_hpp */
