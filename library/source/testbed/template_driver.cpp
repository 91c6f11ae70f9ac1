#include <cstddef> // for std::size_t
#include <exception> // for std::exception
#include <fstream>
#include <iterator> // for std::istreambuf_iterator
#include <sstream> // for std::ostringstream
#include <system_error> // for std::error_code
#include <utility> // for std::move

#include <nlohmann/json.hpp>
#include <jinja.hpp>

#include "testbed/errors.hpp"
#include "testbed/evaluator.hpp"
#include "testbed/template_driver.hpp"

namespace testbed {

namespace {

auto read_template(const std::filesystem::path& path) -> std::string
{
    std::ifstream stream{path};
    if (!stream) {
        std::ostringstream os;
        os << "cannot read template " << path;
        throw render_error{os.str()};
    }
    return {std::istreambuf_iterator<char>(stream),
            std::istreambuf_iterator<char>()};
}

auto write_output(const std::filesystem::path& path, const std::string& text)
    -> void
{
    if (path.has_parent_path()) {
        auto ec = std::error_code{};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::ostringstream os;
            os << "cannot create directory " << path.parent_path();
            os << ": " << ec.message();
            throw render_error{os.str()};
        }
    }
    std::ofstream stream{path, std::ios::out|std::ios::trunc};
    if (!stream) {
        std::ostringstream os;
        os << "cannot open " << path << " for writing";
        throw render_error{os.str()};
    }
    stream << text;
    stream.flush();
    if (!stream) {
        std::ostringstream os;
        os << "cannot write " << path;
        throw render_error{os.str()};
    }
}

/// @brief Longest range that's given to templates as a list.
/// @note Longer ranges are given as an object of their endpoints.
constexpr auto max_listed_range = std::size_t{1u} << 16u;

auto to_context(const value& v) -> nlohmann::json;

auto to_context(const field_list& fields, nlohmann::json object)
    -> nlohmann::json
{
    for (auto&& f: fields) {
        object[f.name.get()] = to_context(f.data);
    }
    return object;
}

auto to_context(const value& v) -> nlohmann::json
{
    return std::visit(detail::overloaded{
        [](const std::string& arg) -> nlohmann::json {
            return arg;
        },
        [](std::int64_t arg) -> nlohmann::json {
            return arg;
        },
        [](bool arg) -> nlohmann::json {
            return arg;
        },
        [](const list& arg) {
            auto result = nlohmann::json::array();
            for (auto&& element: arg) {
                result.push_back(to_context(element));
            }
            return result;
        },
        [](const structure& arg) {
            return to_context(arg.fields, nlohmann::json::object());
        },
        [](const artifact& arg) {
            auto result = nlohmann::json::object();
            result["source"] = arg.source_path;
            result["output"] = arg.output_path;
            return to_context(arg.properties, std::move(result));
        },
        [](const range& arg) {
            if (arg.size() > max_listed_range) {
                auto result = nlohmann::json::object();
                result["first"] = arg.first;
                result["last"] = arg.last;
                return result;
            }
            auto result = nlohmann::json::array();
            for (auto i = std::size_t{0}; i < arg.size(); ++i) {
                result.push_back(arg.at(i));
            }
            return result;
        },
    }, v.data);
}

/// @brief Context of every visible binding, the innermost one winning.
auto make_context(const environment& env, const std::string& origin)
    -> nlohmann::json
{
    auto result = nlohmann::json::object();
    for (auto&& name: env.names()) {
        try {
            result[name.get()] = to_context(env.lookup(name).get());
        }
        catch (const eval_error& ex) {
            std::ostringstream os;
            os << origin << ": cannot give " << name << " to the template";
            os << ": " << ex.what();
            throw render_error{os.str()};
        }
    }
    return result;
}

auto render(const std::string& text, const nlohmann::json& context,
            const std::string& origin) -> std::string
{
    try {
        const auto compiled = jinja::Template{text};
        return compiled.render(context);
    }
    catch (const std::exception& ex) {
        std::ostringstream os;
        os << origin << ": cannot render: " << ex.what();
        throw render_error{os.str()};
    }
}

}

template_driver::template_driver(std::vector<std::filesystem::path> search_paths,
                                 std::filesystem::path output_directory):
    search_paths_{std::move(search_paths)},
    output_directory_{std::move(output_directory)}
{
    // Intentionally empty.
}

auto template_driver::find_template(const std::string& name) const
    -> std::optional<std::filesystem::path>
{
    auto ec = std::error_code{};
    const auto path = std::filesystem::path{name};
    if (path.is_relative()) {
        for (auto&& dir: search_paths_) {
            const auto full_path = dir / path;
            if (std::filesystem::is_regular_file(full_path, ec)) {
                return full_path;
            }
        }
    }
    if (std::filesystem::is_regular_file(path, ec)) {
        return path;
    }
    return {};
}

auto template_driver::build(const std::string& template_path,
                            const std::string& output_path,
                            field_list properties,
                            const evaluator& eval) -> artifact
{
    const auto found = find_template(template_path);
    if (!found) {
        std::ostringstream os;
        os << "no template " << std::filesystem::path{template_path};
        os << " in the current directory";
        for (auto&& dir: search_paths_) {
            os << " or " << dir;
        }
        throw render_error{os.str()};
    }
    const auto origin = found->string();
    const auto text = render(read_template(*found),
                             make_context(eval.variables(), origin), origin);
    const auto output = output_directory_ / output_path;
    write_output(output, text);
    return artifact{origin, output.string(), std::move(properties)};
}

auto template_driver::start(const identifier& name) -> void
{
    current_ = name;
    yielded_.clear();
}

auto template_driver::yield(value v) -> void
{
    if (!current_) {
        throw eval_error{"yield is only available in template blocks"};
    }
    yielded_.push_back(std::move(v));
}

auto template_driver::finish() -> list
{
    current_.reset();
    return std::exchange(yielded_, list{});
}

auto template_driver::output_directory() const
    -> const std::filesystem::path&
{
    return output_directory_;
}

}
