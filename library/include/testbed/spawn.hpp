#ifndef spawn_hpp
#define spawn_hpp

#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "testbed/owning_descriptor.hpp" // for open_mode
#include "testbed/owning_process_id.hpp"

namespace testbed {

/// @brief Redirection of a standard stream to a file.
struct redirection
{
    std::filesystem::path path;
    open_mode mode{open_mode::truncate};
};

auto operator<<(std::ostream& os, const redirection& value) -> std::ostream&;

/// @brief Everything needed to launch one process.
struct spawn_request
{
    /// @brief Program to run, searched for in <code>PATH</code> if it has
    ///   no directory separator.
    std::filesystem::path program;

    /// @brief Arguments given after the program name.
    std::vector<std::string> arguments;

    /// @brief Working directory of the process. Empty for the current one.
    std::filesystem::path working_directory;

    /// @brief Standard output redirection. Inherited when not set.
    std::optional<redirection> out;

    /// @brief Standard error redirection. Inherited when not set.
    std::optional<redirection> err;
};

auto operator<<(std::ostream& os, const spawn_request& value) -> std::ostream&;

/// @brief Called in the parent with the new child's process ID.
using spawn_observer = std::function<void(reference_process_id)>;

/// @brief Launches the requested process.
/// @note Any open C stdio streams are flushed before forking.
/// @note A relative program with a directory part is relative to the
///   request's working directory when it has one.
/// @note The child doesn't exec until @started has returned.
/// @throws spawn_error if the program can't be found or run, the working
///   directory isn't a directory, or a redirection file can't be opened.
auto spawn(const spawn_request& request, const spawn_observer& started = {})
    -> owning_process_id;

}

#endif /* spawn_hpp */
