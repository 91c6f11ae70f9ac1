#ifndef utility_hpp
#define utility_hpp

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace testbed {

/// @brief Makes a vector that's compatible for use with <code>execve</code>'s
///   <code>argv</code> parameter.
/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>;

/// @brief Finds the given file in the given colon separated directory list.
auto find_file(const std::filesystem::path& file, std::string_view path)
    -> std::optional<std::filesystem::path>;

}

#endif /* utility_hpp */
