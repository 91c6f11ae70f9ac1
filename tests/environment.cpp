#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "testbed/environment.hpp"
#include "testbed/errors.hpp"

using namespace testbed;

TEST(environment, default_construction)
{
    const auto env = environment{};
    EXPECT_EQ(env.depth(), 1u);
    EXPECT_FALSE(env.find(identifier("x")));
    EXPECT_THROW(static_cast<void>(env.lookup(identifier("x"))),
                 undefined_variable);
}

TEST(environment, declare_and_lookup)
{
    auto env = environment{};
    env.declare(identifier("x"), value("one"));
    EXPECT_EQ(*env.lookup(identifier("x")), value("one"));
    EXPECT_THROW(env.declare(identifier("x"), value("two")),
                 redeclaration_error);
}

TEST(environment, shadowing_and_scopes)
{
    auto env = environment{};
    env.declare(identifier("x"), value(1));
    {
        const scope_guard guard{env};
        EXPECT_EQ(env.depth(), 2u);
        env.declare(identifier("x"), value(2));
        env.declare(identifier("y"), value(3));
        EXPECT_EQ(*env.lookup(identifier("x")), value(2));
    }
    EXPECT_EQ(env.depth(), 1u);
    EXPECT_EQ(*env.lookup(identifier("x")), value(1));
    EXPECT_FALSE(env.find(identifier("y")));
}

TEST(environment, names)
{
    auto env = environment{};
    EXPECT_TRUE(env.names().empty());
    env.declare(identifier("b"), value(1));
    env.declare(identifier("a"), value(2));
    const scope_guard guard{env};
    env.declare(identifier("c"), value(3));
    env.declare(identifier("a"), value(4));
    const auto names = env.names();
    ASSERT_EQ(size(names), 3u);
    EXPECT_EQ(names[0], identifier("a"));
    EXPECT_EQ(names[1], identifier("c"));
    EXPECT_EQ(names[2], identifier("b"));
}

TEST(environment, pop_keeps_global_scope)
{
    auto env = environment{};
    env.pop_scope();
    EXPECT_EQ(env.depth(), 1u);
}

TEST(environment, reassign)
{
    auto env = environment{};
    env.declare(identifier("x"), value(1));
    {
        const scope_guard guard{env};
        env.reassign(identifier("x"), value(2));
    }
    EXPECT_EQ(*env.lookup(identifier("x")), value(2));
    EXPECT_THROW(env.reassign(identifier("nope"), value(1)), undefined_variable);
}

TEST(environment, read_only_bindings)
{
    auto env = environment{};
    env.declare_global(identifier("artifacts"), value(list{}), true);
    EXPECT_THROW(env.reassign(identifier("artifacts"), value(1)), type_mismatch);
    EXPECT_THROW(static_cast<void>(env.storage(identifier("artifacts"), {})),
                 type_mismatch);
    EXPECT_THROW(env.declare_global(identifier("artifacts"), value(1)),
                 redeclaration_error);
}

TEST(environment, alias_sees_later_reassignment)
{
    auto env = environment{};
    env.declare(identifier("x"), value("before"));
    env.declare(identifier("y"), env.make_alias(identifier("x")));
    env.reassign(identifier("x"), value("after"));
    EXPECT_EQ(*env.lookup(identifier("y")), value("after"));
}

TEST(environment, alias_into_structure)
{
    auto env = environment{};
    env.declare(identifier("s"), value(structure{"s", {
        field{identifier("items"), value(list{value(10), value(20)})},
    }}));
    const auto a = env.make_alias(identifier("s"),
                                  {identifier("items"), std::size_t{1}});
    EXPECT_EQ(*env.resolve(a), value(20));
    std::ostringstream os;
    os << a;
    EXPECT_EQ(os.str(), "s.items[1]");
}

TEST(environment, alias_into_deeper_scope_is_copied)
{
    auto env = environment{};
    env.declare(identifier("outer"), value(""));
    {
        const scope_guard guard{env};
        env.declare(identifier("inner"), value("kept"));
        env.reassign(identifier("outer"), env.make_alias(identifier("inner")));
    }
    EXPECT_EQ(*env.lookup(identifier("outer")), value("kept"));
}

TEST(environment, self_alias_is_copied)
{
    auto env = environment{};
    env.declare(identifier("x"), value(1));
    env.reassign(identifier("x"), env.make_alias(identifier("x")));
    EXPECT_EQ(*env.lookup(identifier("x")), value(1));
}

TEST(environment, storage)
{
    auto env = environment{};
    env.declare(identifier("l"), value(list{value(list{})}));
    auto& inner = env.storage(identifier("l"), {std::size_t{0}});
    std::get<list>(inner.data).push_back(value(1));
    const auto view = env.lookup(identifier("l"));
    EXPECT_EQ(*view, value(list{value(list{value(1)})}));
    EXPECT_THROW(static_cast<void>(env.storage(identifier("l"), {std::size_t{1}})),
                 index_out_of_range);
    EXPECT_THROW(static_cast<void>(env.storage(identifier("l"), {identifier("f")})),
                 type_mismatch);
}

TEST(environment, storage_through_alias)
{
    auto env = environment{};
    env.declare(identifier("l"), value(list{}));
    env.declare(identifier("a"), env.make_alias(identifier("l")));
    EXPECT_THROW(static_cast<void>(env.storage(identifier("a"), {})),
                 type_mismatch);
}

TEST(environment, descend)
{
    const auto l = value(list{value("a"), value("b")});
    EXPECT_EQ(*descend(value_view{l}, std::size_t{1}), value("b"));
    EXPECT_TRUE(descend(value_view{l}, std::size_t{1}).is_borrowed());
    EXPECT_THROW(descend(value_view{l}, std::size_t{2}), index_out_of_range);
    EXPECT_THROW(descend(value_view{l}, identifier("x")), type_mismatch);

    const auto r = value(range{3, 0});
    EXPECT_EQ(*descend(value_view{r}, std::size_t{0}), value(3));
    EXPECT_FALSE(descend(value_view{r}, std::size_t{0}).is_borrowed());
    EXPECT_THROW(descend(value_view{r}, std::size_t{3}), index_out_of_range);

    const auto s = value(structure{"n", {field{identifier("f"), value(1)}}});
    EXPECT_EQ(*descend(value_view{s}, identifier("f")), value(1));
    EXPECT_THROW(descend(value_view{s}, identifier("g")), field_not_found);
    EXPECT_THROW(descend(value_view{s}, std::size_t{0}), type_mismatch);

    const auto a = value(artifact{"t.tpl", "out/t.txt",
                                  {field{identifier("n"), value(2)}}});
    EXPECT_EQ(*descend(value_view{a}, identifier("n")), value(2));
    EXPECT_EQ(*descend(value_view{a}, identifier("source")), value("t.tpl"));
    EXPECT_EQ(*descend(value_view{a}, identifier("output")), value("out/t.txt"));
    EXPECT_THROW(descend(value_view{a}, identifier("other")), field_not_found);
}

TEST(environment, undefined_alias_target)
{
    auto env = environment{};
    EXPECT_THROW(static_cast<void>(env.make_alias(identifier("x"))),
                 undefined_variable);
}
