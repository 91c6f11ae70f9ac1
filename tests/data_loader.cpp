#include <gtest/gtest.h>

#include "testbed/data_loader.hpp"
#include "testbed/errors.hpp"

#include "temporary_directory.hpp"

using namespace testbed;

TEST(data_loader, scalars)
{
    EXPECT_EQ(load_json("42"), value(42));
    EXPECT_EQ(load_json("-7"), value(-7));
    EXPECT_EQ(load_json("true"), value(true));
    EXPECT_EQ(load_json("\"text\""), value("text"));
    EXPECT_EQ(load_json("null"), value(""));
    EXPECT_EQ(load_json("1.5"), value("1.5"));
}

TEST(data_loader, array)
{
    EXPECT_EQ(load_json("[1, \"two\", [3]]"),
              value(list{value(1), value("two"), value(list{value(3)})}));
    EXPECT_EQ(load_json("[]"), value(list{}));
}

TEST(data_loader, object)
{
    const auto v = load_json(R"({"zeta": 1, "name": "db", "alpha": {"port": 5432}})");
    const auto p = std::get_if<structure>(&v.data);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->name, "db");
    ASSERT_EQ(size(p->fields), 3u);
    EXPECT_EQ(p->fields[0].name, identifier("zeta"));
    EXPECT_EQ(p->fields[1].name, identifier("name"));
    EXPECT_EQ(p->fields[1].data, value("db"));
    EXPECT_EQ(p->fields[2].name, identifier("alpha"));
    const auto alpha = std::get_if<structure>(&p->fields[2].data.data);
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->name, "");
    ASSERT_NE(find(alpha->fields, identifier("port")), nullptr);
    EXPECT_EQ(*find(alpha->fields, identifier("port")), value(5432));
}

TEST(data_loader, errors)
{
    EXPECT_THROW(load_json("{", "broken.json"), load_error);
    EXPECT_THROW(load_json(""), load_error);
    EXPECT_THROW(load_json(R"({"not valid": 1})"), load_error);
    EXPECT_THROW(load_json("18446744073709551615"), load_error);
    try {
        load_json("[1,", "broken.json");
        FAIL() << "expected a load_error";
    }
    catch (const load_error& ex) {
        EXPECT_EQ(std::string(ex.what()).rfind("broken.json: ", 0), 0u);
    }
}

TEST(data_loader, load)
{
    const auto dir = temporary_directory{"data-loader"};
    write_file(dir / "hosts.json", R"([{"name": "a"}, {"name": "b"}])");
    const auto v = load(dir / "hosts.json");
    const auto p = std::get_if<list>(&v.data);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(size(*p), 2u);
    EXPECT_THROW(load(dir / "missing.json"), load_error);
}
