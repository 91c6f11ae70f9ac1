#include <cerrno> // for errno
#include <sstream> // for std::ostringstream
#include <system_error> // for std::error_code

#include "testbed/os_error_code.hpp"

namespace testbed {

auto last_error_code() noexcept -> os_error_code
{
    return os_error_code{errno};
}

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&
{
    const auto ec = std::error_code{int(err), std::system_category()};
    os << ec << " (" << ec.message() << ")";
    return os;
}

auto to_string(os_error_code err) -> std::string
{
    std::ostringstream os;
    os << err;
    return os.str();
}

}
