#include <fcntl.h> // for ::open
#include <unistd.h> // for ::access, ::chdir, ::dup2, ::execve, ::read

#include <cerrno> // for errno
#include <cstdio> // for std::fflush
#include <cstdlib> // for std::getenv
#include <sstream> // for std::ostringstream
#include <string>
#include <system_error> // for std::error_code

#include "testbed/errors.hpp"
#include "testbed/spawn.hpp"
#include "testbed/utility.hpp"

extern char **environ; // NOLINT(readability-redundant-declaration)

namespace testbed {

namespace {

constexpr auto exec_failure_code = 127;

/// @brief Reports the given error to the parent then exits.
/// @note Only calls async-signal-safe functions, so it's callable from a
///   forked child.
[[noreturn]]
auto fail_child(const owning_descriptor& report, int err) -> void
{
    // Nothing more can be done in the child if this write fails.
    static_cast<void>(::write(int(report), &err, sizeof(err)));
    ::_exit(exec_failure_code); // NOLINT(concurrency-mt-unsafe)
}

auto redirect(const owning_descriptor& file, reference_descriptor to,
              const owning_descriptor& report) -> void
{
    if (file && (::dup2(int(file), int(to)) == -1)) {
        fail_child(report, errno);
    }
}

auto resolve_program(const std::filesystem::path& program,
                     const std::filesystem::path& directory)
    -> std::filesystem::path
{
    if (program.empty()) {
        throw spawn_error{"no file specified to execute"};
    }
    auto exe_path = program;
    if (exe_path.is_relative() && !exe_path.has_parent_path()) {
        const auto path_env = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
        if (!path_env) {
            throw spawn_error{"no PATH to find file " + program.string()};
        }
        const auto found = find_file(exe_path, path_env);
        if (!found) {
            throw spawn_error{"no such file in PATH as " + program.string()};
        }
        exe_path = *found;
    }
    // The child runs the program after changing to the directory.
    const auto checked_path = (exe_path.is_relative() && !directory.empty())
        ? directory / exe_path: exe_path;
    auto ec = std::error_code{};
    if (!is_regular_file(checked_path, ec) || ec) {
        throw spawn_error{"no such file as " + checked_path.string()};
    }
    if (::access(checked_path.c_str(), X_OK) == -1) {
        throw spawn_error{"cannot execute " + checked_path.string() + ": " +
                          to_string(last_error_code())};
    }
    return exe_path;
}

auto open_redirection(const std::optional<redirection>& target)
    -> owning_descriptor
{
    if (!target) {
        return owning_descriptor{};
    }
    auto ec = std::error_code{};
    if (const auto parent = target->path.parent_path(); !parent.empty()) {
        create_directories(parent, ec);
        if (ec) {
            throw spawn_error{"cannot create directory " + parent.string() +
                              ": " + ec.message()};
        }
    }
    auto result = open_for_writing(target->path, target->mode);
    if (!result) {
        throw spawn_error{"cannot open " + target->path.string() + ": " +
                          to_string(last_error_code())};
    }
    return result;
}

/// @brief Blocks until the other end of the gate is closed.
/// @note Only calls async-signal-safe functions.
auto wait_for_gate(const owning_descriptor& gate) noexcept -> void
{
    auto byte = char{};
    for (;;) {
        const auto n = ::read(int(gate), &byte, sizeof(byte));
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
    }
}

auto read_child_report(const owning_descriptor& report) -> int
{
    auto err = 0;
    for (;;) {
        const auto n = ::read(int(report), &err, sizeof(err));
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return (n == static_cast<ssize_t>(sizeof(err)))? err: 0;
    }
}

}

auto operator<<(std::ostream& os, const redirection& value) -> std::ostream&
{
    os << ((value.mode == open_mode::append)? "append(": "truncate(");
    os << value.path << ")";
    return os;
}

auto operator<<(std::ostream& os, const spawn_request& value) -> std::ostream&
{
    os << value.program.string();
    for (auto&& arg: value.arguments) {
        os << " " << arg;
    }
    return os;
}

auto spawn(const spawn_request& request, const spawn_observer& started)
    -> owning_process_id
{
    if (!request.working_directory.empty()) {
        auto ec = std::error_code{};
        if (!is_directory(request.working_directory, ec) || ec) {
            throw spawn_error{"no such directory as " +
                              request.working_directory.string()};
        }
    }
    const auto exe_path = resolve_program(request.program,
                                          request.working_directory);
    const auto out = open_redirection(request.out);
    const auto err = open_redirection(request.err);

    auto arg_buffers = std::vector<std::string>{request.program.string()};
    arg_buffers.insert(end(arg_buffers),
                       begin(request.arguments), end(request.arguments));
    auto argv = make_argv(arg_buffers);
    const auto directory = request.working_directory.string();

    auto report = close_on_exec_pipe{};
    auto gate = close_on_exec_pipe{};
    try {
        report = make_close_on_exec_pipe();
        gate = make_close_on_exec_pipe();
    }
    catch (const std::system_error& ex) {
        throw spawn_error{std::string{"cannot make spawn pipes: "} + ex.what()};
    }

    std::fflush(nullptr);
    const auto pid = owning_process_id::fork();
    if (pid == invalid_process_id) {
        throw spawn_error{"fork failed: " + to_string(last_error_code())};
    }
    if (pid == no_process_id) { // child process
        // Have to be careful here! Only async-signal-safe functions are
        // called until execve.
        static_cast<void>(gate.write_end.close());
        wait_for_gate(gate.read_end);
        redirect(out, descriptors::stdout_id, report.write_end);
        redirect(err, descriptors::stderr_id, report.write_end);
        if (!directory.empty() && (::chdir(directory.c_str()) == -1)) {
            fail_child(report.write_end, errno);
        }
        ::execve(exe_path.c_str(), argv.data(), environ);
        fail_child(report.write_end, errno);
    }

    auto child = owning_process_id{pid};
    {
        const auto unused = std::move(gate.read_end);
    }
    if (started) {
        started(pid);
    }
    {
        // Lets the child go on to exec.
        const auto gate_end = std::move(gate.write_end);
        // Closes this end so the read sees end of file once the child execs.
        const auto write_end = std::move(report.write_end);
    }
    if (const auto child_err = read_child_report(report.read_end)) {
        child.wait();
        std::ostringstream os;
        os << "execve of " << exe_path << " failed: " << os_error_code(child_err);
        throw spawn_error{os.str()};
    }
    return child;
}

}
