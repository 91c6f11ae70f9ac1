#ifndef signal_hpp
#define signal_hpp

#include <ostream>

namespace testbed {

/// @brief Signal strong type wrapping a POSIX signal number.
enum class signal: int;

auto operator<<(std::ostream& os, signal s) -> std::ostream&;

namespace signals {
auto interrupt() noexcept -> signal;
auto terminate() noexcept -> signal;
auto kill() noexcept -> signal;
auto child() noexcept -> signal;
}

/// @brief Installs the handler that counts deliveries of the given signal.
/// @throws std::system_error if the handler can't be installed.
auto set_signal_handler(signal sig) -> void;

/// @brief Restores the default disposition of the given signal.
/// @note For <code>SIGCHLD</code> this undoes an inherited
///   <code>SIG_IGN</code>, which would otherwise have children reaped
///   before their exit status can be collected.
/// @throws std::system_error if the disposition can't be changed.
auto reset_signal_handler(signal sig) -> void;

/// @brief Forgets any signals counted so far.
auto sigsafe_counter_reset() noexcept -> void;

/// @brief Takes one counted signal if there is one.
/// @note Safe to call from anywhere, including signal handlers.
auto sigsafe_counter_take() noexcept -> bool;

}

#endif /* signal_hpp */
