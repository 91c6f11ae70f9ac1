#include <gtest/gtest.h>

#include <csignal> // for ::signal, ::sigaction
#include <sstream> // for std::ostringstream

#include "testbed/errors.hpp"
#include "testbed/scheduler.hpp"
#include "testbed/signal.hpp"

using namespace testbed;
using namespace std::chrono_literals;

namespace {

auto shell(const std::string& script) -> spawn_request
{
    auto request = spawn_request{};
    request.program = "/bin/sh";
    request.arguments = {"-c", script};
    return request;
}

auto contains(const std::string& text, const std::string& part) -> bool
{
    return text.find(part) != std::string::npos;
}

}

TEST(scheduler, default_construction)
{
    std::ostringstream diags;
    const auto pool = scheduler{diags};
    EXPECT_EQ(pool.state(), run_state::idle);
    EXPECT_EQ(pool.limit(), 0u);
    EXPECT_EQ(pool.live(), 0u);
    EXPECT_TRUE(pool.records().empty());
}

TEST(scheduler, spawn_and_wait_all)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("exit 0"));
    pool.spawn(shell("exit 3"), 7);
    EXPECT_EQ(pool.state(), run_state::running);
    EXPECT_EQ(pool.wait_all(), wait_outcome::completed);
    EXPECT_EQ(pool.live(), 0u);
    ASSERT_EQ(size(pool.records()), 2u);
    EXPECT_EQ(pool.records()[0].state, process_state::exited);
    EXPECT_EQ(pool.records()[0].status, wait_status(wait_exit_status{0}));
    EXPECT_EQ(pool.records()[1].status, wait_status(wait_exit_status{3}));
    EXPECT_EQ(pool.records()[1].id, std::optional<std::int64_t>{7});
    EXPECT_TRUE(pool.records()[1].finished);
    EXPECT_TRUE(contains(diags.str(), "spawned "));
    EXPECT_TRUE(contains(diags.str(), "status exit-status=3"));
}

TEST(scheduler, wait_all_with_children_ignored)
{
    // With SIGCHLD ignored, children are reaped by the system on exit.
    ASSERT_NE(::signal(SIGCHLD, SIG_IGN), SIG_ERR);
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("exit 0"));
    const auto outcome = pool.wait_all(5s);
    reset_signal_handler(signals::child());
    EXPECT_EQ(outcome, wait_outcome::completed);
    EXPECT_EQ(pool.live(), 0u);
    ASSERT_EQ(size(pool.records()), 1u);
    EXPECT_EQ(pool.records()[0].state, process_state::exited);
    EXPECT_TRUE(pool.records()[0].finished);

    struct ::sigaction current{};
    ASSERT_EQ(::sigaction(SIGCHLD, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_DFL);
}

TEST(scheduler, limit)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.limit(1u);
    pool.spawn(shell("sleep 0.1"));
    pool.spawn(shell("exit 0"));
    EXPECT_EQ(pool.wait_all(), wait_outcome::completed);
    const auto& records = pool.records();
    ASSERT_EQ(size(records), 2u);
    ASSERT_TRUE(records[0].finished);
    EXPECT_GE(records[1].started, *records[0].finished);
}

TEST(scheduler, wait_all_timeout)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("sleep 0.5"));
    EXPECT_EQ(pool.wait_all(50ms), wait_outcome::timeout);
    EXPECT_EQ(pool.live(), 1u);
    EXPECT_TRUE(contains(diags.str(), "timeout after 50ms with 1 live"));
    EXPECT_EQ(pool.wait_all(), wait_outcome::completed);
    EXPECT_EQ(pool.records()[0].state, process_state::exited);
}

TEST(scheduler, wait_for)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("exit 0"), 1);
    pool.spawn(shell("sleep 5"), 2);
    EXPECT_EQ(pool.wait_for(1), wait_outcome::completed);
    EXPECT_EQ(pool.wait_for(2, 20ms, 2u), wait_outcome::timeout);
    EXPECT_TRUE(contains(diags.str(), "attempt 1 of 2"));
    EXPECT_TRUE(contains(diags.str(), "attempt 2 of 2"));
    EXPECT_EQ(pool.records()[1].state, process_state::timed_out);
    EXPECT_TRUE(std::holds_alternative<wait_signaled_status>(pool.records()[1].status));
    EXPECT_EQ(pool.live(), 0u);
    EXPECT_THROW(pool.wait_for(3), undefined_variable);
}

TEST(scheduler, kill)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("sleep 5"), 4);
    pool.kill(4);
    EXPECT_EQ(pool.records()[0].state, process_state::killed);
    EXPECT_EQ(pool.live(), 0u);
    pool.kill(4);
    EXPECT_TRUE(contains(diags.str(), ": already killed"));
    EXPECT_THROW(pool.kill(5), undefined_variable);
}

TEST(scheduler, duplicate_live_id)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("sleep 5"), 1);
    EXPECT_THROW(pool.spawn(shell("exit 0"), 1), spawn_error);
    pool.kill(1);
    EXPECT_NO_THROW(pool.spawn(shell("exit 0"), 1));
    EXPECT_EQ(pool.wait_for(1), wait_outcome::completed);
    EXPECT_EQ(pool.records().back().state, process_state::exited);
}

TEST(scheduler, drain_and_finish)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.limit(2u);
    pool.spawn(shell("exit 0"));
    pool.drain();
    EXPECT_EQ(pool.limit(), 0u);
    EXPECT_EQ(pool.live(), 0u);
    EXPECT_EQ(pool.state(), run_state::running);
    pool.finish();
    EXPECT_EQ(pool.state(), run_state::done);
}

TEST(scheduler, kill_all)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    pool.spawn(shell("sleep 5"));
    pool.spawn(shell("sleep 5"));
    pool.kill_all();
    EXPECT_EQ(pool.live(), 0u);
    for (auto&& record: pool.records()) {
        EXPECT_EQ(record.state, process_state::killed);
    }
}

TEST(scheduler, sleep)
{
    std::ostringstream diags;
    auto pool = scheduler{diags, {1ms}};
    const auto start = scheduler::clock::now();
    pool.sleep(20ms);
    EXPECT_GE(scheduler::clock::now() - start, 20ms);
}

TEST(scheduler, spawn_error)
{
    std::ostringstream diags;
    auto pool = scheduler{diags};
    auto request = spawn_request{};
    request.program = "no-such-program-for-testbed";
    EXPECT_THROW(pool.spawn(request), spawn_error);
    EXPECT_TRUE(pool.records().empty());
}

TEST(scheduler, ostream)
{
    std::ostringstream os;
    os << process_state::timed_out << " " << run_state::draining << " ";
    os << wait_outcome::timeout;
    EXPECT_EQ(os.str(), "timed-out draining timeout");
}
