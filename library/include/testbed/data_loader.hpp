#ifndef data_loader_hpp
#define data_loader_hpp

#include <filesystem>
#include <string>
#include <string_view>

#include "testbed/value.hpp"

namespace testbed {

/// @brief Converts the given JSON text into a value.
/// @note Objects become structures named by their <code>"name"</code>
///   member, keeping their members in document order.
/// @throws load_error if the text isn't valid JSON or has a member name
///   that isn't an identifier.
auto load_json(std::string_view text, const std::string& origin = {})
    -> value;

/// @brief Loads the JSON file at the given path.
/// @throws load_error if the file can't be read or isn't valid.
auto load(const std::filesystem::path& path) -> value;

}

#endif /* data_loader_hpp */
