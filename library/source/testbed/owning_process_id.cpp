#include <unistd.h> // for ::fork
#include <csignal> // for ::kill
#include <cerrno> // for ESRCH

#include <utility> // for std::exchange

#include "testbed/owning_process_id.hpp"

namespace testbed {

auto owning_process_id::fork() noexcept -> reference_process_id
{
    return reference_process_id{::fork()};
}

owning_process_id::owning_process_id(reference_process_id id) noexcept
    : pid{id}
{
    // Intentionally empty.
}

owning_process_id::owning_process_id(owning_process_id&& other) noexcept
    : pid{std::exchange(other.pid, default_process_id)},
      last_status{std::exchange(other.last_status, default_status)}
{
    // Intentionally empty.
}

owning_process_id::~owning_process_id()
{
    if (pid > no_process_id) {
        wait();
    }
}

auto owning_process_id::operator=(owning_process_id&& other) noexcept
    -> owning_process_id&
{
    if (this != &other) {
        if (pid > no_process_id) {
            wait();
        }
        pid = std::exchange(other.pid, default_process_id);
        last_status = std::exchange(other.last_status, default_status);
    }
    return *this;
}

owning_process_id::operator reference_process_id() const noexcept
{
    return pid;
}

auto owning_process_id::wait(wait_option flags) noexcept -> wait_status
{
    if (pid <= no_process_id) {
        return last_status;
    }
    for (;;) {
        const auto result = testbed::wait(pid, flags);
        if (std::holds_alternative<empty_wait_result>(result)) {
            return wait_unknown_status{};
        }
        if (const auto p = std::get_if<info_wait_result>(&result)) {
            if (is_terminated(p->status)) {
                last_status = p->status;
                pid = default_process_id;
                return last_status;
            }
            continue;
        }
        // No child to wait on or an error: nothing more can be learned.
        pid = default_process_id;
        return last_status;
    }
}

auto owning_process_id::send(signal sig) const noexcept -> os_error_code
{
    if (pid <= no_process_id) {
        return os_error_code(ESRCH);
    }
    if (::kill(int(pid), int(sig)) == -1) {
        return last_error_code();
    }
    return os_error_code{};
}

auto owning_process_id::status() const noexcept -> wait_status
{
    return last_status;
}

}
