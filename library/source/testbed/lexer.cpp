#include <charconv> // for std::from_chars
#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream

#include "testbed/identifier.hpp" // for is_identifier_start
#include "testbed/lexer.hpp"

namespace testbed {

namespace {

constexpr auto is_digit(char c) noexcept -> bool
{
    return (c >= '0') && (c <= '9');
}

constexpr auto is_space(char c) noexcept -> bool
{
    return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n');
}

struct scanner
{
    std::string_view text;
    std::string origin;
    std::size_t pos{};
    std::size_t line{1u};
    std::size_t column{1u};

    [[nodiscard]] auto at_end() const noexcept -> bool
    {
        return pos >= text.size();
    }

    [[nodiscard]] auto peek(std::size_t ahead = 0u) const noexcept -> char
    {
        return (pos + ahead < text.size())? text[pos + ahead]: '\0';
    }

    auto advance() noexcept -> char
    {
        const auto c = text[pos++];
        if (c == '\n') {
            ++line;
            column = 1u;
        }
        else {
            ++column;
        }
        return c;
    }

    [[nodiscard]] auto here() const -> source_position
    {
        return source_position{origin, line, column};
    }

    auto skip_space_and_comments() noexcept -> void
    {
        while (!at_end()) {
            if (is_space(peek())) {
                advance();
            }
            else if (peek() == '/' && peek(1u) == '/') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
            }
            else {
                break;
            }
        }
    }

    auto scan_string(token& result) -> void
    {
        advance(); // opening quote
        for (;;) {
            if (at_end() || peek() == '\n') {
                throw syntax_error{result.where, "unterminated string",
                    "closing '\"'"};
            }
            const auto c = advance();
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                result.text += c;
                continue;
            }
            if (at_end()) {
                throw syntax_error{result.where, "unterminated string",
                    "closing '\"'"};
            }
            const auto escape_position = here();
            switch (const auto e = advance()) {
            case '"':
            case '\\':
                result.text += e;
                break;
            case 'n':
                result.text += '\n';
                break;
            case 't':
                result.text += '\t';
                break;
            default:
                throw syntax_error{escape_position,
                    std::string("escape '\\") + e + "'",
                    "one of the escapes \\\", \\\\, \\n or \\t"};
            }
        }
    }

    auto scan_integer(token& result) -> void
    {
        const auto first = pos;
        if (peek() == '-') {
            advance();
        }
        while (is_digit(peek())) {
            advance();
        }
        result.text = std::string(text.substr(first, pos - first));
        const auto begin = result.text.data();
        const auto end = begin + result.text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, result.integer);
        if (ec != std::errc{} || ptr != end) {
            throw syntax_error{result.where, "integer " + result.text,
                "an integer that fits in 64 bits"};
        }
    }

    auto scan_identifier(token& result) -> void
    {
        const auto first = pos;
        while (is_identifier_part(peek())) {
            advance();
        }
        result.text = std::string(text.substr(first, pos - first));
    }

    auto scan_punctuation(token& result) -> void
    {
        using kind = token::kind;
        const auto c = advance();
        result.text = std::string(1u, c);
        switch (c) {
        case '[': result.type = kind::left_bracket; return;
        case ']': result.type = kind::right_bracket; return;
        case '{': result.type = kind::left_brace; return;
        case '}': result.type = kind::right_brace; return;
        case '(': result.type = kind::left_paren; return;
        case ')': result.type = kind::right_paren; return;
        case ',': result.type = kind::comma; return;
        case ';': result.type = kind::semicolon; return;
        case '=': result.type = kind::equals; return;
        case '+': result.type = kind::plus; return;
        case '*': result.type = kind::star; return;
        case '.':
            if (peek() == '.') {
                advance();
                result.type = kind::dot_dot;
                result.text = "..";
            }
            else {
                result.type = kind::dot;
            }
            return;
        case ':':
            if (peek() == '=') {
                advance();
                result.type = kind::colon_equals;
                result.text = ":=";
                return;
            }
            break;
        default:
            break;
        }
        std::ostringstream os;
        os << "character " << std::quoted(result.text, '\'');
        throw syntax_error{result.where, os.str(), "a token"};
    }

    auto next() -> token
    {
        skip_space_and_comments();
        auto result = token{};
        result.where = here();
        if (at_end()) {
            result.type = token::kind::end;
            return result;
        }
        const auto c = peek();
        if (c == '"') {
            result.type = token::kind::string;
            scan_string(result);
        }
        else if (is_digit(c) || (c == '-' && is_digit(peek(1u)))) {
            result.type = token::kind::integer;
            scan_integer(result);
        }
        else if (is_identifier_start(c)) {
            result.type = token::kind::identifier;
            scan_identifier(result);
        }
        else {
            scan_punctuation(result);
        }
        return result;
    }
};

}

auto operator<<(std::ostream& os, token::kind value) -> std::ostream&
{
    using kind = token::kind;
    switch (value) {
    case kind::end: os << "end of input"; break;
    case kind::identifier: os << "identifier"; break;
    case kind::integer: os << "integer"; break;
    case kind::string: os << "string"; break;
    case kind::left_bracket: os << "'['"; break;
    case kind::right_bracket: os << "']'"; break;
    case kind::left_brace: os << "'{'"; break;
    case kind::right_brace: os << "'}'"; break;
    case kind::left_paren: os << "'('"; break;
    case kind::right_paren: os << "')'"; break;
    case kind::comma: os << "','"; break;
    case kind::semicolon: os << "';'"; break;
    case kind::dot: os << "'.'"; break;
    case kind::dot_dot: os << "'..'"; break;
    case kind::equals: os << "'='"; break;
    case kind::colon_equals: os << "':='"; break;
    case kind::plus: os << "'+'"; break;
    case kind::star: os << "'*'"; break;
    }
    return os;
}

auto describe(const token& value) -> std::string
{
    std::ostringstream os;
    switch (value.type) {
    case token::kind::identifier:
        os << "identifier " << value.text;
        break;
    case token::kind::integer:
        os << "integer " << value.text;
        break;
    case token::kind::string:
        os << "string " << std::quoted(value.text);
        break;
    default:
        os << value.type;
        break;
    }
    return os.str();
}

auto tokenize(std::string_view text, const std::string& origin)
    -> std::vector<token>
{
    auto s = scanner{text, origin};
    auto result = std::vector<token>{};
    for (;;) {
        result.push_back(s.next());
        if (result.back().type == token::kind::end) {
            break;
        }
    }
    return result;
}

}
