#include <gtest/gtest.h>

#include <csignal> // for SIGKILL
#include <thread> // for std::this_thread::sleep_for

#include <unistd.h> // for ::_exit, ::pause

#include "testbed/owning_process_id.hpp"

using namespace testbed;

TEST(owning_process_id, default_construction)
{
    const auto id = owning_process_id{};
    EXPECT_EQ(reference_process_id(id), invalid_process_id);
    EXPECT_EQ(id.status(), wait_status(wait_unknown_status{}));
    EXPECT_NE(id.send(signals::kill()), os_error_code(0));
}

TEST(owning_process_id, exit_status)
{
    const auto pid = owning_process_id::fork();
    if (pid == no_process_id) {
        ::_exit(3);
    }
    ASSERT_NE(pid, invalid_process_id);
    auto id = owning_process_id{pid};
    EXPECT_EQ(id.wait(), wait_status(wait_exit_status{3}));
    EXPECT_EQ(reference_process_id(id), invalid_process_id);
    EXPECT_EQ(id.status(), wait_status(wait_exit_status{3}));
    EXPECT_EQ(id.wait(), wait_status(wait_exit_status{3}));
}

TEST(owning_process_id, nohang_then_kill)
{
    const auto pid = owning_process_id::fork();
    if (pid == no_process_id) {
        for (;;) {
            ::pause();
        }
    }
    ASSERT_NE(pid, invalid_process_id);
    auto id = owning_process_id{pid};
    EXPECT_EQ(id.wait(wait_options::nohang()), wait_status(wait_unknown_status{}));
    EXPECT_EQ(reference_process_id(id), pid);
    EXPECT_EQ(id.send(signals::kill()), os_error_code(0));
    const auto status = id.wait();
    const auto p = std::get_if<wait_signaled_status>(&status);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->signal, SIGKILL);
    EXPECT_TRUE(is_terminated(id.status()));
}

TEST(owning_process_id, move)
{
    const auto pid = owning_process_id::fork();
    if (pid == no_process_id) {
        ::_exit(0);
    }
    ASSERT_NE(pid, invalid_process_id);
    auto a = owning_process_id{pid};
    auto b = owning_process_id{std::move(a)};
    EXPECT_EQ(reference_process_id(a), invalid_process_id);
    EXPECT_EQ(reference_process_id(b), pid);
    EXPECT_TRUE(is_success(b.wait()));
}

TEST(owning_process_id, destruction_reaps)
{
    auto pid = reference_process_id{};
    {
        pid = owning_process_id::fork();
        if (pid == no_process_id) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ::_exit(0);
        }
        ASSERT_NE(pid, invalid_process_id);
        const auto id = owning_process_id{pid};
    }
    EXPECT_EQ(testbed::wait(pid, wait_options::nohang()),
              wait_result(nokids_wait_result{}));
}
