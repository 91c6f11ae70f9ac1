#include <sys/types.h> // for pid_t
#include <sys/wait.h> // for ::waitpid, WNOHANG

#include <cerrno> // for errno, EINTR, ECHILD

#include "testbed/wait_result.hpp"

namespace testbed {

auto wait_options::nohang() noexcept -> wait_option
{
    return wait_option(WNOHANG);
}

auto operator<<(std::ostream& os, const empty_wait_result&)
    -> std::ostream&
{
    os << "empty wait result";
    return os;
}

auto operator<<(std::ostream& os, const nokids_wait_result&)
    -> std::ostream&
{
    os << "no child processes to wait for";
    return os;
}

auto operator<<(std::ostream& os, const error_wait_result& arg)
    -> std::ostream&
{
    os << arg.data;
    return os;
}

auto operator<<(std::ostream& os, const info_wait_result& arg)
    -> std::ostream&
{
    os << arg.id << ", " << arg.status;
    return os;
}

auto wait(reference_process_id id, wait_option flags) noexcept
    -> wait_result
{
    auto status = 0;
    auto pid = pid_t{};
    auto err = 0;
    for (;;) {
        pid = ::waitpid(pid_t(id), &status, int(flags));
        err = errno;
        if ((pid != -1) || (err != EINTR)) {
            break;
        }
    }
    if (pid < 0) { // treat all negatives as error
        if (err == ECHILD) {
            return nokids_wait_result{};
        }
        return error_wait_result{os_error_code(err)};
    }
    if (pid == 0) {
        return empty_wait_result{};
    }
    if (WIFEXITED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_exit_status{WEXITSTATUS(status)}};
    }
    if (WIFSIGNALED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_signaled_status{WTERMSIG(status), WCOREDUMP(status) != 0}};
    }
    if (WIFSTOPPED(status)) {
        // Only seen for traced children since WUNTRACED isn't offered.
        return info_wait_result{reference_process_id{pid},
            wait_stopped_status{WSTOPSIG(status)}};
    }
    if (WIFCONTINUED(status)) {
        return info_wait_result{reference_process_id{pid},
            wait_continued_status{}};
    }
    return info_wait_result{reference_process_id{pid}};
}

}
