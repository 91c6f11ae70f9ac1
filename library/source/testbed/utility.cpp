#include <system_error> // for std::error_code

#include "testbed/utility.hpp"

namespace testbed {

namespace {

auto find_in(const std::filesystem::path& file, std::string_view dir)
    -> std::optional<std::filesystem::path>
{
    if (dir.empty()) {
        return {};
    }
    auto ec = std::error_code{};
    const auto full_path = std::filesystem::path(dir) / file;
    if (exists(full_path, ec) && !ec) {
        return full_path;
    }
    return {};
}

}

auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>
{
    auto result = std::vector<char*>{};
    for (auto&& arg: args) {
        result.push_back(arg.data());
    }
    result.push_back(nullptr); // last element must always be nullptr!
    return result;
}

auto find_file(const std::filesystem::path& file, std::string_view path)
    -> std::optional<std::filesystem::path>
{
    static constexpr auto delimiter = ':';
    auto last = std::size_t{};
    auto next = std::size_t{};
    while ((next = path.find(delimiter, last)) != std::string_view::npos) {
        if (auto found = find_in(file, path.substr(last, next - last))) {
            return found;
        }
        last = next + 1u;
    }
    return find_in(file, path.substr(last));
}

}
