#include <algorithm> // for std::min
#include <string> // for std::to_string
#include <thread> // for std::this_thread::sleep_for
#include <utility> // for std::move

#include "testbed/errors.hpp"
#include "testbed/scheduler.hpp"
#include "testbed/signal.hpp"

namespace testbed {

auto operator<<(std::ostream& os, wait_outcome value) -> std::ostream&
{
    switch (value) {
    case wait_outcome::completed:
        os << "completed";
        break;
    case wait_outcome::timeout:
        os << "timeout";
        break;
    }
    return os;
}

auto operator<<(std::ostream& os, process_state value) -> std::ostream&
{
    switch (value) {
    case process_state::spawned:
        os << "spawned";
        break;
    case process_state::running:
        os << "running";
        break;
    case process_state::exited:
        os << "exited";
        break;
    case process_state::killed:
        os << "killed";
        break;
    case process_state::timed_out:
        os << "timed-out";
        break;
    }
    return os;
}

auto operator<<(std::ostream& os, run_state value) -> std::ostream&
{
    switch (value) {
    case run_state::idle:
        os << "idle";
        break;
    case run_state::running:
        os << "running";
        break;
    case run_state::draining:
        os << "draining";
        break;
    case run_state::done:
        os << "done";
        break;
    }
    return os;
}

scheduler::scheduler(std::ostream& diags_, scheduler_options options_)
    : diags{diags_}, options{options_}
{
    // Intentionally empty.
}

scheduler::~scheduler()
{
    kill_all();
}

auto scheduler::limit(std::size_t n) noexcept -> void
{
    max_live = n;
}

auto scheduler::limit() const noexcept -> std::size_t
{
    return max_live;
}

auto scheduler::spawn(spawn_request request, std::optional<std::int64_t> id)
    -> reference_process_id
{
    if (current == run_state::idle || current == run_state::done) {
        current = run_state::running;
    }
    while ((max_live > 0u) && (size(pool) >= max_live)) {
        check_interrupt();
        poll();
        if (size(pool) >= max_live) {
            pause({});
        }
    }
    check_interrupt();
    if (id) {
        if (const auto it = ids.find(*id);
            (it != ids.end()) && pool.contains(it->second)) {
            throw spawn_error{"process id " + std::to_string(*id) +
                              " already in use"};
        }
    }
    diags.flush();
    auto handle = testbed::spawn(request, [this, &request](reference_process_id pid){
        diags << "spawned " << int(pid) << " " << request << "\n";
        diags.flush();
    });
    const auto sequence = size(history);
    const auto pid = reference_process_id(handle);
    history.push_back(process_record{
        sequence, id, pid, std::move(request), process_state::spawned,
        wait_unknown_status{}, clock::now(), {}
    });
    pool.emplace(sequence, std::move(handle));
    if (id) {
        ids[*id] = sequence;
    }
    return pid;
}

auto scheduler::sleep(std::chrono::milliseconds duration) -> void
{
    const auto deadline = clock::now() + duration;
    for (;;) {
        check_interrupt();
        if (clock::now() >= deadline) {
            return;
        }
        pause(deadline);
    }
}

auto scheduler::wait_all(std::optional<std::chrono::milliseconds> timeout)
    -> wait_outcome
{
    const auto deadline = timeout
        ? std::optional<clock::time_point>{clock::now() + *timeout}
        : std::optional<clock::time_point>{};
    for (;;) {
        check_interrupt();
        poll();
        if (pool.empty()) {
            return wait_outcome::completed;
        }
        if (deadline && (clock::now() >= *deadline)) {
            diags << "timeout after " << timeout->count() << "ms with ";
            diags << size(pool) << " live\n";
            return wait_outcome::timeout;
        }
        pause(deadline);
    }
}

auto scheduler::wait_for(std::int64_t id,
                         std::optional<std::chrono::milliseconds> timeout,
                         std::size_t attempts) -> wait_outcome
{
    const auto sequence = find(id);
    attempts = std::max(attempts, std::size_t{1u});
    for (auto attempt = 1u; attempt <= attempts; ++attempt) {
        const auto deadline = timeout
            ? std::optional<clock::time_point>{clock::now() + *timeout}
            : std::optional<clock::time_point>{};
        for (;;) {
            check_interrupt();
            poll();
            if (!pool.contains(sequence)) {
                return wait_outcome::completed;
            }
            if (deadline && (clock::now() >= *deadline)) {
                break;
            }
            pause(deadline);
        }
        diags << "timeout " << int(history[sequence].pid);
        diags << " attempt " << attempt << " of " << attempts << "\n";
    }
    terminate(sequence, process_state::timed_out);
    return wait_outcome::timeout;
}

auto scheduler::kill(std::int64_t id) -> void
{
    const auto sequence = find(id);
    if (!pool.contains(sequence)) {
        diags << "kill " << int(history[sequence].pid) << ": already ";
        diags << history[sequence].state << "\n";
        return;
    }
    terminate(sequence, process_state::killed);
}

auto scheduler::drain() -> void
{
    current = run_state::draining;
    wait_all();
    max_live = 0u;
    current = run_state::running;
}

auto scheduler::kill_all() noexcept -> void
{
    while (!pool.empty()) {
        terminate(pool.begin()->first, process_state::killed);
    }
}

auto scheduler::finish() -> void
{
    drain();
    current = run_state::done;
}

auto scheduler::live() const noexcept -> std::size_t
{
    return size(pool);
}

auto scheduler::records() const noexcept -> const std::vector<process_record>&
{
    return history;
}

auto scheduler::state() const noexcept -> run_state
{
    return current;
}

auto scheduler::poll() -> void
{
    for (auto it = pool.begin(); it != pool.end();) {
        const auto sequence = it->first;
        const auto status = it->second.wait(wait_options::nohang());
        // A handle that lost its process without a status won't ever get one.
        const auto lost = reference_process_id(it->second) == invalid_process_id;
        ++it;
        if (is_terminated(status) || lost) {
            reap(sequence, status);
        }
        else if (history[sequence].state == process_state::spawned) {
            history[sequence].state = process_state::running;
        }
    }
}

auto scheduler::pause(std::optional<clock::time_point> deadline) const -> void
{
    auto duration = clock::duration{options.poll_interval};
    if (deadline) {
        duration = std::min(duration, *deadline - clock::now());
    }
    if (duration > clock::duration::zero()) {
        std::this_thread::sleep_for(duration);
    }
}

auto scheduler::check_interrupt() -> void
{
    if (sigsafe_counter_take()) {
        diags << "interrupted, killing " << size(pool) << " live\n";
        kill_all();
        throw interrupted_error{"interrupted"};
    }
}

auto scheduler::reap(std::size_t sequence, const wait_status& status) -> void
{
    auto& record = history[sequence];
    record.status = status;
    record.finished = clock::now();
    if ((record.state == process_state::spawned) ||
        (record.state == process_state::running)) {
        record.state = process_state::exited;
    }
    diags << "exited " << int(record.pid) << " status " << status << "\n";
    pool.erase(sequence);
}

auto scheduler::terminate(std::size_t sequence, process_state as) noexcept
    -> void
{
    const auto it = pool.find(sequence);
    if (it == pool.end()) {
        return;
    }
    auto& record = history[sequence];
    if (const auto ec = it->second.send(signals::kill());
        ec != os_error_code{}) {
        diags << "kill " << int(record.pid) << " failed: " << ec << "\n";
    }
    else {
        diags << "kill " << int(record.pid) << "\n";
    }
    record.state = as;
    record.status = it->second.wait();
    record.finished = clock::now();
    pool.erase(it);
}

auto scheduler::find(std::int64_t id) const -> std::size_t
{
    const auto it = ids.find(id);
    if (it == ids.end()) {
        throw undefined_variable{"no process with id " + std::to_string(id)};
    }
    return it->second;
}

}
