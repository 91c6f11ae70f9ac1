#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "testbed/errors.hpp"
#include "testbed/spawn.hpp"

#include "temporary_directory.hpp"

using namespace testbed;

namespace {

auto shell(const std::string& script) -> spawn_request
{
    auto request = spawn_request{};
    request.program = "/bin/sh";
    request.arguments = {"-c", script};
    return request;
}

}

TEST(spawn, exit_status)
{
    auto child = spawn(shell("exit 5"));
    EXPECT_EQ(child.wait(), wait_status(wait_exit_status{5}));
}

TEST(spawn, path_lookup)
{
    auto request = spawn_request{};
    request.program = "sh";
    request.arguments = {"-c", "exit 0"};
    auto child = spawn(request);
    EXPECT_TRUE(is_success(child.wait()));
}

TEST(spawn, arguments_and_output)
{
    const auto dir = temporary_directory{"spawn-args"};
    auto request = shell("printf '%s|' \"$0\" \"$@\"");
    request.arguments.push_back("zero");
    request.arguments.push_back("one two");
    request.arguments.push_back("three");
    request.out = redirection{dir / "out.txt"};
    auto child = spawn(request);
    EXPECT_TRUE(is_success(child.wait()));
    EXPECT_EQ(read_file(dir / "out.txt"), "zero|one two|three|");
}

TEST(spawn, truncate_and_append)
{
    const auto dir = temporary_directory{"spawn-modes"};
    const auto path = dir / "logs/out.txt";
    for (auto&& word: {"a", "b"}) {
        auto request = shell(std::string{"echo "} + word + "; echo e" + word + " >&2");
        request.out = redirection{path, open_mode::append};
        request.err = redirection{dir / "logs/err.txt", open_mode::truncate};
        auto child = spawn(request);
        EXPECT_TRUE(is_success(child.wait()));
    }
    EXPECT_EQ(read_file(path), "a\nb\n");
    EXPECT_EQ(read_file(dir / "logs/err.txt"), "eb\n");
    auto request = shell("echo c");
    request.out = redirection{path};
    auto child = spawn(request);
    EXPECT_TRUE(is_success(child.wait()));
    EXPECT_EQ(read_file(path), "c\n");
}

TEST(spawn, working_directory)
{
    const auto dir = temporary_directory{"spawn-cwd"};
    auto request = shell("pwd -P > where.txt");
    request.working_directory = dir.path();
    auto child = spawn(request);
    EXPECT_TRUE(is_success(child.wait()));
    EXPECT_EQ(read_file(dir / "where.txt"),
              std::filesystem::canonical(dir.path()).string() + "\n");
}

TEST(spawn, program_relative_to_working_directory)
{
    const auto dir = temporary_directory{"spawn-relative"};
    create_directories(dir / "work");
    const auto script = dir / "work/app.sh";
    write_file(script, "#!/bin/sh\necho in-work\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    auto request = spawn_request{};
    request.program = "./app.sh";
    request.working_directory = dir / "work";
    request.out = redirection{dir / "out.txt"};
    auto child = spawn(request);
    EXPECT_TRUE(is_success(child.wait()));
    EXPECT_EQ(read_file(dir / "out.txt"), "in-work\n");

    request.working_directory = dir.path();
    EXPECT_THROW(spawn(request), spawn_error);
}

TEST(spawn, observer_runs_before_exec)
{
    const auto dir = temporary_directory{"spawn-observer"};
    const auto path = dir / "order.txt";
    auto observed = invalid_process_id;
    auto child = spawn(shell("echo second >> '" + path.string() + "'"),
                       [&](reference_process_id pid){
        observed = pid;
        write_file(path, "first\n");
    });
    EXPECT_EQ(observed, reference_process_id(child));
    EXPECT_TRUE(is_success(child.wait()));
    EXPECT_EQ(read_file(path), "first\nsecond\n");
}

TEST(spawn, errors)
{
    const auto dir = temporary_directory{"spawn-errors"};
    EXPECT_THROW(spawn(spawn_request{}), spawn_error);
    auto request = spawn_request{};
    request.program = "no-such-program-for-testbed";
    EXPECT_THROW(spawn(request), spawn_error);
    request.program = dir / "missing";
    EXPECT_THROW(spawn(request), spawn_error);
    write_file(dir / "plain.txt", "not a program");
    request.program = dir / "plain.txt";
    EXPECT_THROW(spawn(request), spawn_error);
    request = shell("exit 0");
    request.working_directory = dir / "nowhere";
    EXPECT_THROW(spawn(request), spawn_error);
}

TEST(spawn, exec_failure)
{
    const auto dir = temporary_directory{"spawn-exec"};
    const auto path = dir / "bad.sh";
    write_file(path, "no interpreter line");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    auto request = spawn_request{};
    request.program = path;
    try {
        spawn(request);
        FAIL() << "expected a spawn_error";
    }
    catch (const spawn_error& ex) {
        EXPECT_NE(std::string(ex.what()).find("execve"), std::string::npos);
    }
}

TEST(spawn, request_ostream)
{
    std::ostringstream os;
    os << shell("exit 0");
    EXPECT_EQ(os.str(), "/bin/sh -c exit 0");
}
