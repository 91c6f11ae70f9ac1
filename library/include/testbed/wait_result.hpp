#ifndef wait_result_hpp
#define wait_result_hpp

#include <concepts> // for std::regular.
#include <ostream>

#include "testbed/os_error_code.hpp"
#include "testbed/reference_process_id.hpp"
#include "testbed/variant.hpp" // for <variant>, testbed::variant, plus ostream support
#include "testbed/wait_status.hpp"

namespace testbed {

enum class wait_option: int;

constexpr auto operator|(const wait_option& lhs,
                         const wait_option& rhs) noexcept
    -> wait_option
{
    return wait_option(int(lhs) | int(rhs));
}

constexpr auto operator&(const wait_option& lhs,
                         const wait_option& rhs) noexcept
    -> wait_option
{
    return wait_option(int(lhs) & int(rhs));
}

namespace wait_options {
/// @brief Option to return right away if no child has changed state.
auto nohang() noexcept -> wait_option;
}

/// @brief Result of a non-blocking wait for a child that's still running.
struct empty_wait_result {
    constexpr auto operator<=>(const empty_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const empty_wait_result&)
    -> std::ostream&;

struct nokids_wait_result {
    constexpr auto operator<=>(const nokids_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const nokids_wait_result&)
    -> std::ostream&;

struct error_wait_result {
    os_error_code data;
    constexpr auto operator<=>(const error_wait_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const error_wait_result& arg)
    -> std::ostream&;

struct info_wait_result {
    reference_process_id id{invalid_process_id};
    wait_status status{wait_unknown_status{}};
};

constexpr auto operator==(const info_wait_result& lhs,
                          const info_wait_result& rhs) noexcept
{
    return (lhs.id == rhs.id) && (lhs.status == rhs.status);
}

auto operator<<(std::ostream& os, const info_wait_result& arg)
    -> std::ostream&;

using wait_result = variant<
    empty_wait_result,
    nokids_wait_result,
    error_wait_result,
    info_wait_result
>;

static_assert(std::regular<wait_result>);

/// @brief Waits for the identified child process to change state.
/// @note Retries for as long as the wait gets interrupted by signals.
auto wait(reference_process_id id = invalid_process_id,
          wait_option flags = {}) noexcept
    -> wait_result;

}

#endif /* wait_result_hpp */
