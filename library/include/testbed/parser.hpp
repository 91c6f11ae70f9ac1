#ifndef parser_hpp
#define parser_hpp

#include <filesystem>
#include <string>
#include <string_view>

#include "testbed/syntax.hpp"

namespace testbed {

/// @brief Parses the given configuration source text.
/// @param text Configuration source.
/// @param origin Name of the source used in diagnostics.
/// @param base Directory that relative <code>[includes]</code> paths are
///   resolved against.
/// @throws syntax_error if the text isn't a valid configuration.
auto parse(std::string_view text,
           const std::string& origin = {},
           const std::filesystem::path& base = {}) -> syntax::program;

/// @brief Parses the configuration file at the given path.
/// @note Includes are resolved relative to the file's directory.
/// @throws syntax_error if the file can't be read or isn't valid.
auto parse_file(const std::filesystem::path& path) -> syntax::program;

/// @brief Parses a lone access chain like <code>a.b[c].d</code>.
/// @throws syntax_error if the text isn't exactly one access chain.
auto parse_access(std::string_view text, const std::string& origin = {})
    -> syntax::access;

}

#endif /* parser_hpp */
