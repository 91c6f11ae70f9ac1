#include "testbed/wait_status.hpp"

namespace testbed {

auto operator<<(std::ostream& os, const wait_unknown_status&) -> std::ostream&
{
    os << "unknown";
    return os;
}

auto operator<<(std::ostream& os, const wait_exit_status& value) -> std::ostream&
{
    os << "exit-status=" << value.value;
    return os;
}

auto operator<<(std::ostream& os, const wait_signaled_status& value) -> std::ostream&
{
    os << "signal=" << value.signal;
    if (value.core_dumped) {
        os << ", core-dumped";
    }
    return os;
}

auto operator<<(std::ostream& os, const wait_stopped_status& value) -> std::ostream&
{
    os << "stop-signal=" << value.stop_signal;
    return os;
}

auto operator<<(std::ostream& os, const wait_continued_status&) -> std::ostream&
{
    os << "continued";
    return os;
}

}
