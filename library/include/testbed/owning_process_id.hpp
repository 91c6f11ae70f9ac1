#ifndef owning_process_id_hpp
#define owning_process_id_hpp

#include <cstdint> // for std::int32_t
#include <type_traits> // for std::is_default_constructible_v

#include "testbed/os_error_code.hpp"
#include "testbed/reference_process_id.hpp"
#include "testbed/signal.hpp"
#include "testbed/wait_result.hpp"

namespace testbed {

/// @brief Owning process identifier.
/// @note Provides some RAII-styled ownership handling for spawned processes.
///   Destruction waits for the owned process to terminate.
struct owning_process_id
{
    static constexpr auto default_process_id = invalid_process_id;
    static constexpr auto default_status = wait_unknown_status{};

    static auto fork() noexcept -> reference_process_id;

    owning_process_id() noexcept = default;
    explicit owning_process_id(reference_process_id id) noexcept;
    owning_process_id(const owning_process_id& other) = delete;
    owning_process_id(owning_process_id&& other) noexcept;
    ~owning_process_id();

    auto operator=(const owning_process_id& other) -> owning_process_id& = delete;
    auto operator=(owning_process_id&& other) noexcept -> owning_process_id&;

    operator reference_process_id() const noexcept;

    explicit operator std::int32_t() const noexcept
    {
        return std::int32_t(reference_process_id(*this));
    }

    /// @brief Waits for the owned process to terminate.
    /// @note With <code>wait_options::nohang()</code>, returns
    ///   <code>wait_unknown_status{}</code> right away if the process is
    ///   still running.
    /// @post If the returned status is a terminated one, this no longer owns
    ///   any process and <code>status()</code> returns that status.
    auto wait(wait_option flags = {}) noexcept -> wait_status;

    /// @brief Sends the given signal to the owned process.
    auto send(signal sig) const noexcept -> os_error_code;

    /// @brief Status of the process.
    /// @note This is an observer function.
    /// @return <code>wait_unknown_status{}</code> if the associated process
    ///   has not yet been seen to terminate (possibly because this has no
    ///   associated process).
    [[nodiscard]] auto status() const noexcept -> wait_status;

private:
    reference_process_id pid{default_process_id};
    wait_status last_status{default_status};
};

static_assert(std::is_default_constructible_v<owning_process_id>);
static_assert(std::is_move_constructible_v<owning_process_id>);
static_assert(std::is_move_assignable_v<owning_process_id>);
static_assert(!std::is_copy_constructible_v<owning_process_id>);
static_assert(!std::is_copy_assignable_v<owning_process_id>);

}

#endif /* owning_process_id_hpp */
