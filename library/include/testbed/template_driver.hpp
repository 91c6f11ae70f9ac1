#ifndef template_driver_hpp
#define template_driver_hpp

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "testbed/identifier.hpp"
#include "testbed/value.hpp"

namespace testbed {

class evaluator;

/// @brief Builds artifacts from templates and collects what a template
///   block yields.
class template_driver
{
public:
    /// @param search_paths Directories searched for templates, in order.
    /// @param output_directory Base directory of the files written.
    template_driver(std::vector<std::filesystem::path> search_paths,
                    std::filesystem::path output_directory);

    /// @brief Finds the named template.
    /// @note Looks in each search path first, then tries the name itself.
    [[nodiscard]] auto find_template(const std::string& name) const
        -> std::optional<std::filesystem::path>;

    /// @brief Renders a template to a file under the output directory.
    /// @throws render_error if the template can't be found, read or
    ///   rendered, or the output can't be written.
    auto build(const std::string& template_path,
               const std::string& output_path,
               field_list properties,
               const evaluator& eval) -> artifact;

    /// @brief Starts collecting yields for the named template block.
    auto start(const identifier& name) -> void;

    /// @throws eval_error if no template block was started.
    auto yield(value v) -> void;

    /// @brief Ends the current template block.
    /// @return Values the block yielded, in order.
    auto finish() -> list;

    [[nodiscard]] auto output_directory() const -> const std::filesystem::path&;

private:
    std::vector<std::filesystem::path> search_paths_;
    std::filesystem::path output_directory_;
    std::optional<identifier> current_;
    list yielded_;
};

}

#endif /* template_driver_hpp */
