#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "testbed/identifier.hpp"

using namespace testbed;

TEST(identifier, default_construction)
{
    EXPECT_NO_THROW(identifier());
    EXPECT_TRUE(identifier().get().empty());
}

TEST(identifier, valid_names)
{
    EXPECT_NO_THROW(identifier("a"));
    EXPECT_NO_THROW(identifier("_"));
    EXPECT_NO_THROW(identifier("if_test"));
    EXPECT_NO_THROW(identifier("Node42"));
    EXPECT_EQ(identifier("abc").get(), "abc");
}

TEST(identifier, invalid_names)
{
    EXPECT_THROW(identifier(""), invalid_identifier);
    EXPECT_THROW(identifier("1abc"), invalid_identifier);
    EXPECT_THROW(identifier("a-b"), invalid_identifier);
    EXPECT_THROW(identifier("a b"), invalid_identifier);
    EXPECT_THROW(identifier("a.b"), invalid_identifier);
    EXPECT_THROW(identifier(std::string_view{"x["}), invalid_identifier);
}

TEST(identifier, invalid_identifier_is_invalid_argument)
{
    EXPECT_THROW(identifier("$"), std::invalid_argument);
}

TEST(identifier, comparison)
{
    EXPECT_EQ(identifier("a"), identifier("a"));
    EXPECT_NE(identifier("a"), identifier("b"));
    EXPECT_LT(identifier("a"), identifier("b"));
}

TEST(identifier, ostream_support)
{
    std::ostringstream os;
    os << identifier("name");
    EXPECT_EQ(os.str(), "name");
}
