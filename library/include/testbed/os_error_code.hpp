#ifndef os_error_code_hpp
#define os_error_code_hpp

#include <ostream>
#include <string>

namespace testbed {

/// @brief Operating system error code, an <code>errno</code> value.
enum class os_error_code: int;

/// @brief Error code of the last failed system call.
auto last_error_code() noexcept -> os_error_code;

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_string(os_error_code err) -> std::string;

}

#endif /* os_error_code_hpp */
