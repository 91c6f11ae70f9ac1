#include <gtest/gtest.h>

#include "testbed/lexer.hpp"

using namespace testbed;

namespace {

auto kinds(const std::vector<token>& tokens) -> std::vector<token::kind>
{
    auto result = std::vector<token::kind>{};
    for (auto&& t: tokens) {
        result.push_back(t.type);
    }
    return result;
}

}

TEST(lexer, empty_text)
{
    const auto tokens = tokenize("");
    ASSERT_EQ(size(tokens), 1u);
    EXPECT_EQ(tokens[0].type, token::kind::end);
}

TEST(lexer, comments_and_whitespace)
{
    const auto tokens = tokenize("  // comment\n\t x // another\r\n");
    ASSERT_EQ(size(tokens), 2u);
    EXPECT_EQ(tokens[0].type, token::kind::identifier);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[0].where.line, 2u);
    EXPECT_EQ(tokens[0].where.column, 3u);
}

TEST(lexer, punctuation)
{
    using kind = token::kind;
    const auto tokens = tokenize("[ ] { } ( ) , ; . .. = := + *");
    const auto expected = std::vector<kind>{
        kind::left_bracket, kind::right_bracket,
        kind::left_brace, kind::right_brace,
        kind::left_paren, kind::right_paren,
        kind::comma, kind::semicolon, kind::dot, kind::dot_dot,
        kind::equals, kind::colon_equals, kind::plus, kind::star,
        kind::end,
    };
    EXPECT_EQ(kinds(tokens), expected);
}

TEST(lexer, range_of_integers)
{
    using kind = token::kind;
    const auto tokens = tokenize("0..-3");
    const auto expected = std::vector<kind>{
        kind::integer, kind::dot_dot, kind::integer, kind::end,
    };
    ASSERT_EQ(kinds(tokens), expected);
    EXPECT_EQ(tokens[0].integer, 0);
    EXPECT_EQ(tokens[2].integer, -3);
}

TEST(lexer, string_escapes)
{
    const auto tokens = tokenize(R"("a\"b\\c\nd\te")");
    ASSERT_EQ(size(tokens), 2u);
    EXPECT_EQ(tokens[0].type, token::kind::string);
    EXPECT_EQ(tokens[0].text, "a\"b\\c\nd\te");
}

TEST(lexer, errors)
{
    EXPECT_THROW(tokenize("\"open"), syntax_error);
    EXPECT_THROW(tokenize(R"("\q")"), syntax_error);
    EXPECT_THROW(tokenize("99999999999999999999"), syntax_error);
    EXPECT_THROW(tokenize("a : b"), syntax_error);
    EXPECT_THROW(tokenize("$"), syntax_error);
}

TEST(lexer, error_position)
{
    try {
        tokenize("x = 1;\n  @", "file.tb");
        FAIL() << "expected a syntax_error";
    }
    catch (const syntax_error& ex) {
        EXPECT_EQ(ex.where().origin, "file.tb");
        EXPECT_EQ(ex.where().line, 2u);
        EXPECT_EQ(ex.where().column, 3u);
    }
}

TEST(lexer, describe)
{
    const auto tokens = tokenize("name 12 \"s\" ;");
    EXPECT_EQ(describe(tokens[0]), "identifier name");
    EXPECT_EQ(describe(tokens[1]), "integer 12");
    EXPECT_EQ(describe(tokens[2]), "string \"s\"");
    EXPECT_EQ(describe(tokens[3]), "';'");
    EXPECT_EQ(describe(tokens[4]), "end of input");
}
