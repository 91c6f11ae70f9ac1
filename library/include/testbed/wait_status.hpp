#ifndef wait_status_hpp
#define wait_status_hpp

#include <compare> // for std::strong_ordering
#include <ostream>

#include "testbed/variant.hpp" // for <variant>, testbed::variant, plus ostream support

namespace testbed {

/// @brief Status of a process that hasn't been seen to change state.
struct wait_unknown_status {
    auto operator<=>(const wait_unknown_status&) const = default;
};

auto operator<<(std::ostream& os, const wait_unknown_status& value)
    -> std::ostream&;

struct wait_exit_status {
    int value{};
    auto operator<=>(const wait_exit_status&) const = default;
};

auto operator<<(std::ostream& os, const wait_exit_status& value)
    -> std::ostream&;

struct wait_signaled_status {
    int signal{};
    bool core_dumped{};
    auto operator<=>(const wait_signaled_status&) const = default;
};

auto operator<<(std::ostream& os, const wait_signaled_status& value)
    -> std::ostream&;

struct wait_stopped_status {
    int stop_signal{};
    auto operator<=>(const wait_stopped_status&) const = default;
};

auto operator<<(std::ostream& os, const wait_stopped_status& value)
    -> std::ostream&;

struct wait_continued_status {
    auto operator<=>(const wait_continued_status&) const = default;
};

auto operator<<(std::ostream& os, const wait_continued_status&)
    -> std::ostream&;

using wait_status = variant<
    wait_unknown_status,
    wait_exit_status,
    wait_signaled_status,
    wait_stopped_status,
    wait_continued_status
>;

/// @brief Whether the status is that of a process that's gone.
constexpr auto is_terminated(const wait_status& status) noexcept -> bool
{
    return std::holds_alternative<wait_exit_status>(status) ||
           std::holds_alternative<wait_signaled_status>(status);
}

/// @brief Whether the status is that of a process that exited with 0.
constexpr auto is_success(const wait_status& status) noexcept -> bool
{
    const auto p = std::get_if<wait_exit_status>(&status);
    return p && (p->value == 0);
}

}

#endif /* wait_status_hpp */
