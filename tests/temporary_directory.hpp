#ifndef temporary_directory_hpp
#define temporary_directory_hpp

#include <filesystem>
#include <fstream>
#include <iterator> // for std::istreambuf_iterator
#include <string>
#include <system_error> // for std::error_code

#include <unistd.h> // for ::getpid

/// @brief Uniquely named directory that's removed with its contents on
///   destruction.
class temporary_directory
{
public:
    explicit temporary_directory(const std::string& name)
        : path_{std::filesystem::temp_directory_path() /
                ("testbed-" + name + "-" + std::to_string(::getpid()))}
    {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    temporary_directory(const temporary_directory&) = delete;
    auto operator=(const temporary_directory&) -> temporary_directory& = delete;

    ~temporary_directory()
    {
        auto ec = std::error_code{};
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path&
    {
        return path_;
    }

    auto operator/(const std::filesystem::path& sub) const
        -> std::filesystem::path
    {
        return path_ / sub;
    }

private:
    std::filesystem::path path_;
};

inline auto write_file(const std::filesystem::path& path,
                       const std::string& contents) -> void
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream{path};
    stream << contents;
}

inline auto read_file(const std::filesystem::path& path) -> std::string
{
    std::ifstream stream{path};
    return {std::istreambuf_iterator<char>(stream),
            std::istreambuf_iterator<char>()};
}

#endif /* temporary_directory_hpp */
