#ifndef owning_descriptor_hpp
#define owning_descriptor_hpp

#include <filesystem>
#include <ostream>
#include <type_traits> // for std::is_default_constructible_v

#include "testbed/os_error_code.hpp"

namespace testbed {

/// @brief File descriptor strong type wrapping a POSIX file descriptor.
enum class reference_descriptor: int;

auto operator<<(std::ostream& os, reference_descriptor value) -> std::ostream&;

namespace descriptors {
constexpr auto invalid_id = reference_descriptor{-1};
constexpr auto stdin_id = reference_descriptor{0};
constexpr auto stdout_id = reference_descriptor{1};
constexpr auto stderr_id = reference_descriptor{2};
}

/// @brief Owning file descriptor.
/// @note Closes the descriptor it owns on destruction.
struct owning_descriptor
{
    static constexpr auto default_descriptor = descriptors::invalid_id;

    owning_descriptor() noexcept = default;
    explicit owning_descriptor(reference_descriptor d_) noexcept: d{d_} {}
    explicit owning_descriptor(int d_) noexcept: d{reference_descriptor(d_)} {}
    owning_descriptor(owning_descriptor&& other) noexcept;
    owning_descriptor(const owning_descriptor& other) = delete;
    ~owning_descriptor();

    auto operator=(owning_descriptor&& other) noexcept -> owning_descriptor&;
    auto operator=(const owning_descriptor& other) noexcept = delete;

    operator reference_descriptor() const noexcept { return d; }
    explicit operator int() const noexcept { return int(d); }

    explicit operator bool() const noexcept { return d != default_descriptor; }

    auto close() noexcept -> os_error_code;

private:
    reference_descriptor d{default_descriptor};
};

static_assert(std::is_default_constructible_v<owning_descriptor>);
static_assert(std::is_move_constructible_v<owning_descriptor>);
static_assert(std::is_move_assignable_v<owning_descriptor>);
static_assert(!std::is_copy_constructible_v<owning_descriptor>);
static_assert(!std::is_copy_assignable_v<owning_descriptor>);

enum class open_mode { truncate, append };

/// @brief Opens the given file for writing, creating it if need be.
/// @note The descriptor is opened close-on-exec.
/// @return Owning descriptor that's invalid if opening failed, in which
///   case <code>last_error_code()</code> says why.
auto open_for_writing(const std::filesystem::path& path, open_mode mode)
    noexcept -> owning_descriptor;

/// @brief Pipe whose descriptors are both opened close-on-exec.
struct close_on_exec_pipe
{
    owning_descriptor read_end;
    owning_descriptor write_end;
};

/// @throws std::system_error if the pipe can't be made.
auto make_close_on_exec_pipe() -> close_on_exec_pipe;

}

#endif /* owning_descriptor_hpp */
