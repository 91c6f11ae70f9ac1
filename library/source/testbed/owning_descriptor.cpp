#include <fcntl.h> // for ::open, O_CLOEXEC
#include <unistd.h> // for ::close, ::pipe2

#include <cerrno> // for errno
#include <system_error> // for std::system_error
#include <utility> // for std::exchange

#include "testbed/owning_descriptor.hpp"

namespace testbed {

auto operator<<(std::ostream& os, reference_descriptor value) -> std::ostream&
{
    os << "fd:" << int(value);
    return os;
}

owning_descriptor::~owning_descriptor()
{
    close();
}

owning_descriptor::owning_descriptor(owning_descriptor&& other) noexcept
    : d{std::exchange(other.d, default_descriptor)} {}

auto owning_descriptor::operator=(owning_descriptor&& other) noexcept
    -> owning_descriptor&
{
    if (&other != this) {
        close();
        d = std::exchange(other.d, default_descriptor);
    }
    return *this;
}

auto owning_descriptor::close() noexcept -> os_error_code
{
    if (d != descriptors::invalid_id) {
        const auto fd = int(std::exchange(d, descriptors::invalid_id));
        if (::close(fd) == -1) {
            return os_error_code{errno};
        }
    }
    return os_error_code{};
}

auto open_for_writing(const std::filesystem::path& path, open_mode mode)
    noexcept -> owning_descriptor
{
    static constexpr auto permissions = 0666;
    const auto flags = O_WRONLY|O_CREAT|O_CLOEXEC|
        ((mode == open_mode::append)? O_APPEND: O_TRUNC);
    return owning_descriptor{::open( // NOLINT(cppcoreguidelines-pro-type-vararg)
        path.c_str(), flags, permissions)};
}

auto make_close_on_exec_pipe() -> close_on_exec_pipe
{
    int fds[2] = {-1, -1}; // NOLINT(cppcoreguidelines-avoid-c-arrays)
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw std::system_error{errno, std::system_category(), "pipe2"};
    }
    return {owning_descriptor{fds[0]}, owning_descriptor{fds[1]}};
}

}
