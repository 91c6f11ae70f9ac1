#ifndef lexer_hpp
#define lexer_hpp

#include <cstdint> // for std::int64_t
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "testbed/errors.hpp" // for source_position, syntax_error

namespace testbed {

struct token
{
    enum class kind {
        end,
        identifier,
        integer,
        string,
        left_bracket,
        right_bracket,
        left_brace,
        right_brace,
        left_paren,
        right_paren,
        comma,
        semicolon,
        dot,
        dot_dot,
        equals,
        colon_equals,
        plus,
        star,
    };

    kind type{kind::end};

    /// @brief Spelling of the token.
    /// @note For strings, this is the unescaped contents.
    std::string text;

    std::int64_t integer{};
    source_position where;
};

auto operator<<(std::ostream& os, token::kind value) -> std::ostream&;

/// @brief Human readable description of the token for diagnostics.
auto describe(const token& value) -> std::string;

/// @brief Splits configuration source text into tokens.
/// @note The last token is always of kind <code>token::kind::end</code>.
/// @throws syntax_error for characters that don't start any token,
///   unterminated strings and integers that don't fit.
auto tokenize(std::string_view text, const std::string& origin = {})
    -> std::vector<token>;

}

#endif /* lexer_hpp */
