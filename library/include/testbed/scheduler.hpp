#ifndef scheduler_hpp
#define scheduler_hpp

#include <chrono>
#include <cstddef> // for std::size_t
#include <cstdint> // for std::int64_t
#include <map>
#include <optional>
#include <ostream>
#include <vector>

#include "testbed/owning_process_id.hpp"
#include "testbed/spawn.hpp"
#include "testbed/wait_status.hpp"

namespace testbed {

enum class wait_outcome { completed, timeout };

auto operator<<(std::ostream& os, wait_outcome value) -> std::ostream&;

/// @brief Lifecycle state of a spawned process.
enum class process_state { spawned, running, exited, killed, timed_out };

auto operator<<(std::ostream& os, process_state value) -> std::ostream&;

/// @brief Lifecycle state of the scheduler itself.
enum class run_state { idle, running, draining, done };

auto operator<<(std::ostream& os, run_state value) -> std::ostream&;

/// @brief What's known about a process that was spawned.
struct process_record
{
    using clock = std::chrono::steady_clock;

    /// @brief Zero based order in which the process was spawned.
    std::size_t sequence{};

    /// @brief User given identifier, if any.
    std::optional<std::int64_t> id;

    reference_process_id pid{invalid_process_id};
    spawn_request request;
    process_state state{process_state::spawned};
    wait_status status{wait_unknown_status{}};
    clock::time_point started;
    std::optional<clock::time_point> finished;
};

struct scheduler_options
{
    /// @brief How long to pause between polls for exited processes.
    std::chrono::milliseconds poll_interval{10};
};

/// @brief Live process pool with a concurrency limit.
/// @note Exits are noticed by polling at the suspension points: waiting for
///   a free slot in <code>spawn</code>, <code>wait_all</code>,
///   <code>wait_for</code> and <code>drain</code>. Pending interrupt signals
///   are also checked for at these points and in <code>sleep</code>.
/// @note Destruction kills and reaps any processes still live.
class scheduler
{
public:
    using clock = std::chrono::steady_clock;

    explicit scheduler(std::ostream& diags, scheduler_options options = {});
    scheduler(const scheduler& other) = delete;
    ~scheduler();

    auto operator=(const scheduler& other) -> scheduler& = delete;

    /// @brief Sets the maximum number of live processes. Zero for no limit.
    auto limit(std::size_t n) noexcept -> void;

    [[nodiscard]] auto limit() const noexcept -> std::size_t;

    /// @brief Launches the requested process once a slot is free.
    /// @throws spawn_error if the process can't be launched or if the given
    ///   identifier is already in use by a live process.
    /// @throws interrupted_error if interrupted while waiting for a slot.
    auto spawn(spawn_request request, std::optional<std::int64_t> id = {})
        -> reference_process_id;

    /// @throws interrupted_error if interrupted while sleeping.
    auto sleep(std::chrono::milliseconds duration) -> void;

    /// @brief Waits for every live process to exit or for the timeout.
    /// @note Processes still live on timeout are left running.
    auto wait_all(std::optional<std::chrono::milliseconds> timeout = {})
        -> wait_outcome;

    /// @brief Waits for the identified process up to the given number of
    ///   attempts, killing it if it's still live after the last one.
    /// @throws undefined_variable if no process has the given identifier.
    auto wait_for(std::int64_t id,
                  std::optional<std::chrono::milliseconds> timeout = {},
                  std::size_t attempts = 1u) -> wait_outcome;

    /// @brief Kills and reaps the identified process.
    /// @throws undefined_variable if no process has the given identifier.
    auto kill(std::int64_t id) -> void;

    /// @brief Waits for all live processes then resets the limit.
    auto drain() -> void;

    /// @brief Kills and reaps all live processes.
    auto kill_all() noexcept -> void;

    /// @brief Drains and marks this as done.
    auto finish() -> void;

    [[nodiscard]] auto live() const noexcept -> std::size_t;
    [[nodiscard]] auto records() const noexcept
        -> const std::vector<process_record>&;
    [[nodiscard]] auto state() const noexcept -> run_state;

private:
    auto poll() -> void;
    auto pause(std::optional<clock::time_point> deadline) const -> void;
    auto check_interrupt() -> void;
    auto reap(std::size_t sequence, const wait_status& status) -> void;
    auto terminate(std::size_t sequence, process_state as) noexcept -> void;
    auto find(std::int64_t id) const -> std::size_t;

    std::ostream& diags;
    scheduler_options options;
    std::size_t max_live{};
    run_state current{run_state::idle};
    std::vector<process_record> history;
    std::map<std::size_t, owning_process_id> pool;
    std::map<std::int64_t, std::size_t> ids;
};

}

#endif /* scheduler_hpp */
