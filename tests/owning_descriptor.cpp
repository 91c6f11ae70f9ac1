#include <gtest/gtest.h>

#include <fcntl.h> // for ::open, ::fcntl
#include <unistd.h> // for ::write, ::read

#include "testbed/owning_descriptor.hpp"

#include "temporary_directory.hpp"

using namespace testbed;

TEST(owning_descriptor, default_construction)
{
    ASSERT_NO_THROW(owning_descriptor());
    EXPECT_EQ(int(owning_descriptor::default_descriptor), -1);
    EXPECT_EQ(reference_descriptor(owning_descriptor()),
              owning_descriptor::default_descriptor);
    EXPECT_FALSE(owning_descriptor());
}

TEST(owning_descriptor, close)
{
    owning_descriptor d{::open("/", O_RDONLY, 0)};
    EXPECT_NE(int(d), -1);
    EXPECT_TRUE(d);
    EXPECT_EQ(d.close(), os_error_code(0));
    EXPECT_EQ(int(d), -1);
}

TEST(owning_descriptor, move_construction)
{
    owning_descriptor d{::open("/", O_RDONLY, 0)};
    EXPECT_NE(int(d), -1);
    const owning_descriptor e{std::move(d)};
    EXPECT_EQ(int(d), -1);
    EXPECT_NE(int(e), -1);
}

TEST(owning_descriptor, move_assignment)
{
    owning_descriptor d{::open("/", O_RDONLY, 0)};
    owning_descriptor e;
    e = std::move(d);
    EXPECT_FALSE(d);
    EXPECT_TRUE(e);
}

TEST(owning_descriptor, open_for_writing)
{
    const auto dir = temporary_directory{"descriptor"};
    const auto path = dir / "out.txt";
    {
        const auto d = open_for_writing(path, open_mode::truncate);
        ASSERT_TRUE(d);
        EXPECT_NE(::fcntl(int(d), F_GETFD) & FD_CLOEXEC, 0);
        EXPECT_EQ(::write(int(d), "one\n", 4u), 4);
    }
    {
        const auto d = open_for_writing(path, open_mode::append);
        ASSERT_TRUE(d);
        EXPECT_EQ(::write(int(d), "two\n", 4u), 4);
    }
    EXPECT_EQ(read_file(path), "one\ntwo\n");
    {
        const auto d = open_for_writing(path, open_mode::truncate);
        ASSERT_TRUE(d);
    }
    EXPECT_EQ(read_file(path), "");
    EXPECT_FALSE(open_for_writing(dir / "no/such/dir/out.txt", open_mode::append));
}

TEST(owning_descriptor, close_on_exec_pipe)
{
    auto p = make_close_on_exec_pipe();
    ASSERT_TRUE(p.read_end);
    ASSERT_TRUE(p.write_end);
    EXPECT_NE(::fcntl(int(p.read_end), F_GETFD) & FD_CLOEXEC, 0);
    EXPECT_NE(::fcntl(int(p.write_end), F_GETFD) & FD_CLOEXEC, 0);
    EXPECT_EQ(::write(int(p.write_end), "x", 1u), 1);
    EXPECT_EQ(p.write_end.close(), os_error_code(0));
    char buffer[4] = {};
    EXPECT_EQ(::read(int(p.read_end), buffer, sizeof(buffer)), 1);
    EXPECT_EQ(buffer[0], 'x');
    EXPECT_EQ(::read(int(p.read_end), buffer, sizeof(buffer)), 0);
}
