#include <atomic>
#include <cerrno> // for errno
#include <csignal>
#include <string> // for std::to_string
#include <system_error> // for std::system_error

#include "testbed/signal.hpp"

namespace testbed {

namespace {

auto sigsafe_counter() noexcept -> volatile std::atomic_int32_t&
{
    static_assert(std::atomic_int32_t::is_always_lock_free);
    static volatile auto value = std::atomic_int32_t{};
    return value;
}

auto sigaction_cb(int /*sig*/, siginfo_t * /*info*/, void * /*ucontext*/)
    -> void
{
    ++sigsafe_counter();
}

}

auto operator<<(std::ostream& os, signal s) -> std::ostream&
{
    switch (int(s)) {
    case SIGINT:
        os << "sigint";
        break;
    case SIGTERM:
        os << "sigterm";
        break;
    case SIGKILL:
        os << "sigkill";
        break;
    case SIGCHLD:
        os << "sigchld";
        break;
    default:
        os << "signal-#" << std::to_string(int(s));
        break;
    }
    return os;
}

auto set_signal_handler(signal sig) -> void
{
    struct sigaction sa{};
    sa.sa_sigaction = sigaction_cb;
    sa.sa_flags = SA_SIGINFO;
    sigfillset(&sa.sa_mask);
    if (::sigaction(int(sig), &sa, nullptr) == -1) {
        throw std::system_error{errno, std::system_category(), "sigaction"};
    }
    auto new_set = sigset_t{};
    sigemptyset(&new_set);
    sigaddset(&new_set, int(sig));
    if (::sigprocmask(SIG_UNBLOCK, &new_set, nullptr) == -1) { // NOLINT(concurrency-mt-unsafe)
        throw std::system_error{errno, std::system_category(), "sigprocmask"};
    }
}

auto reset_signal_handler(signal sig) -> void
{
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    if (::sigaction(int(sig), &sa, nullptr) == -1) {
        throw std::system_error{errno, std::system_category(), "sigaction"};
    }
}

auto sigsafe_counter_reset() noexcept -> void
{
    sigsafe_counter().store(0);
}

auto sigsafe_counter_take() noexcept -> bool
{
    for (;;) {
        auto cur = sigsafe_counter().load();
        if (cur <= 0) {
            return false;
        }
        if (sigsafe_counter().compare_exchange_strong(cur, cur - 1)) {
            return true;
        }
    }
}

}

namespace testbed::signals {

auto interrupt() noexcept -> signal
{
    return signal{SIGINT};
}

auto terminate() noexcept -> signal
{
    return signal{SIGTERM};
}

auto kill() noexcept -> signal
{
    return signal{SIGKILL};
}

auto child() noexcept -> signal
{
    return signal{SIGCHLD};
}

}
