#include <cstdint> // for std::int64_t, std::uint64_t
#include <fstream>
#include <iterator> // for std::istreambuf_iterator
#include <limits>
#include <sstream> // for std::ostringstream

#include <nlohmann/json.hpp>

#include "testbed/data_loader.hpp"
#include "testbed/errors.hpp"

namespace testbed {

namespace {

using json = nlohmann::ordered_json;

auto to_value(const json& j, const std::string& origin) -> value;

auto to_structure(const json& j, const std::string& origin) -> structure
{
    auto result = structure{};
    if (const auto it = j.find("name"); it != j.end() && it->is_string()) {
        result.name = it->get<std::string>();
    }
    for (auto&& [key, member]: j.items()) {
        auto name = identifier{};
        try {
            name = identifier{key};
        }
        catch (const invalid_identifier& ex) {
            std::ostringstream os;
            os << origin << ": member name " << key << ": " << ex.what();
            throw load_error{os.str()};
        }
        result.fields.push_back(field{std::move(name), to_value(member, origin)});
    }
    return result;
}

auto to_value(const json& j, const std::string& origin) -> value
{
    switch (j.type()) {
    case json::value_t::null:
        return value{std::string{}};
    case json::value_t::boolean:
        return value{j.get<bool>()};
    case json::value_t::number_integer:
        return value{j.get<std::int64_t>()};
    case json::value_t::number_unsigned: {
        const auto v = j.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            std::ostringstream os;
            os << origin << ": integer " << v << " is too large";
            throw load_error{os.str()};
        }
        return value{static_cast<std::int64_t>(v)};
    }
    case json::value_t::number_float:
        return value{j.dump()};
    case json::value_t::string:
        return value{j.get<std::string>()};
    case json::value_t::array: {
        auto elements = list{};
        for (auto&& element: j) {
            elements.push_back(to_value(element, origin));
        }
        return value{std::move(elements)};
    }
    case json::value_t::object:
        return value{to_structure(j, origin)};
    case json::value_t::binary:
    case json::value_t::discarded:
        break;
    }
    std::ostringstream os;
    os << origin << ": unsupported JSON value of type " << j.type_name();
    throw load_error{os.str()};
}

}

auto load_json(std::string_view text, const std::string& origin) -> value
{
    auto document = json{};
    try {
        document = json::parse(text);
    }
    catch (const json::exception& ex) {
        std::ostringstream os;
        os << origin << ": " << ex.what();
        throw load_error{os.str()};
    }
    return to_value(document, origin);
}

auto load(const std::filesystem::path& path) -> value
{
    std::ifstream stream{path};
    if (!stream) {
        std::ostringstream os;
        os << "cannot open " << path << " to load";
        throw load_error{os.str()};
    }
    const auto text = std::string{std::istreambuf_iterator<char>(stream),
                                  std::istreambuf_iterator<char>()};
    return load_json(text, path.string());
}

}
