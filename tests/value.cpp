#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "testbed/errors.hpp"
#include "testbed/value.hpp"

using namespace testbed;

namespace {

auto to_text(const value& v) -> std::string
{
    std::ostringstream os;
    os << v;
    return os.str();
}

}

TEST(value, default_construction)
{
    EXPECT_EQ(value(), value(""));
    EXPECT_EQ(type_name(value()), "string");
}

TEST(value, type_names)
{
    EXPECT_EQ(type_name(value(3)), "integer");
    EXPECT_EQ(type_name(value(true)), "boolean");
    EXPECT_EQ(type_name(value(list{})), "list");
    EXPECT_EQ(type_name(value(structure{})), "structure");
    EXPECT_EQ(type_name(value(artifact{})), "artifact");
    EXPECT_EQ(type_name(value(range{0, 3})), "range");
}

TEST(value, ascending_range)
{
    const auto r = range{2, 5};
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r.at(0u), 2);
    EXPECT_EQ(r.at(1u), 3);
    EXPECT_EQ(r.at(2u), 4);
}

TEST(value, descending_range)
{
    const auto r = range{5, 2};
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r.at(0u), 5);
    EXPECT_EQ(r.at(1u), 4);
    EXPECT_EQ(r.at(2u), 3);
}

TEST(value, empty_range)
{
    const auto same = range{4, 4};
    EXPECT_EQ(same.size(), 0u);
    const auto across_zero = range{-1, 1};
    EXPECT_EQ(across_zero.size(), 2u);
    EXPECT_EQ(across_zero.at(0u), -1);
}

TEST(value, widest_range)
{
    constexpr auto lowest = std::int64_t{-9223372036854775807};
    constexpr auto highest = std::int64_t{9223372036854775807};
    const auto up = range{lowest, highest};
    EXPECT_EQ(up.size(), std::size_t{18446744073709551614u});
    EXPECT_EQ(up.at(0u), lowest);
    EXPECT_EQ(up.at(up.size() - 1u), highest - 1);
    const auto down = range{highest, lowest};
    EXPECT_EQ(down.size(), up.size());
    EXPECT_EQ(down.at(1u), highest - 1);
    EXPECT_EQ(down.at(down.size() - 1u), lowest + 1);
}

TEST(value, to_string)
{
    EXPECT_EQ(to_string(value("abc")), "abc");
    EXPECT_EQ(to_string(value(-42)), "-42");
    EXPECT_EQ(to_string(value(true)), "true");
    EXPECT_EQ(to_string(value(false)), "false");
    EXPECT_EQ(to_string(value(structure{"node", {}})), "node");
    EXPECT_EQ(to_string(value(artifact{"in.tpl", "out/a.txt", {}})),
              "out/a.txt");
    EXPECT_THROW(to_string(value(list{value(1)})), type_mismatch);
    EXPECT_THROW(to_string(value(range{0, 1})), type_mismatch);
}

TEST(value, to_integer)
{
    EXPECT_EQ(to_integer(value(7)), 7);
    EXPECT_EQ(to_integer(value("12")), 12);
    EXPECT_EQ(to_integer(value("-3")), -3);
    EXPECT_THROW(to_integer(value("")), type_mismatch);
    EXPECT_THROW(to_integer(value("1x")), type_mismatch);
    EXPECT_THROW(to_integer(value(true)), type_mismatch);
    EXPECT_THROW(to_integer(value(list{})), type_mismatch);
}

TEST(value, find_field)
{
    auto fields = field_list{
        field{identifier("a"), value(1)},
        field{identifier("b"), value("two")},
    };
    ASSERT_NE(find(fields, identifier("b")), nullptr);
    EXPECT_EQ(*find(fields, identifier("b")), value("two"));
    EXPECT_EQ(find(fields, identifier("c")), nullptr);
    *find(fields, identifier("a")) = value(3);
    EXPECT_EQ(fields[0].data, value(3));
}

TEST(value, ostream_support)
{
    EXPECT_EQ(to_text(value("a b")), "\"a b\"");
    EXPECT_EQ(to_text(value(5)), "5");
    EXPECT_EQ(to_text(value(list{value(1), value("x")})), "[1, \"x\"]");
    EXPECT_EQ(to_text(value(range{1, 4})), "1..4");
    EXPECT_EQ(to_text(value(structure{"n", {field{identifier("a"), value(1)}}})),
              "\"n\" { a = 1 }");
    EXPECT_EQ(to_text(value(structure{"n", {}})), "\"n\" {}");
    EXPECT_EQ(to_text(value(artifact{"t", "o", {}})), "build(\"t\", \"o\")");
}

TEST(value, equality_is_deep)
{
    const auto a = value(list{value(structure{"s", {field{identifier("x"), value(1)}}})});
    auto b = a;
    EXPECT_EQ(a, b);
    std::get<structure>(std::get<list>(b.data)[0].data).fields[0].data = value(2);
    EXPECT_NE(a, b);
}
