#ifndef checked_hpp
#define checked_hpp

#include <compare> // for std::strong_ordering
#include <type_traits>
#include <utility> // for std::forward

namespace testbed::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Strongly typed value that can only hold what its checker accepts.
/// @note The default value is whatever <code>Checker{}()</code> returns.
template <class T, functor_returns<T, T> Checker>
struct checked
{
    using value_type = T;
    using checker_type = Checker;

    checked() // NOLINT(bugprone-exception-escape)
    noexcept(noexcept(Checker{}()) && std::is_nothrow_move_constructible_v<T>):
        data{Checker{}()}
    {
        // Intentionally empty.
    }

    template <class U, class V = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, checked> &&
        functor_returns<Checker, T, U>
    >>
    checked(U&& u): data{
        checker_type{}(std::forward<U>(u)) // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
    }
    {
        // Intentionally empty.
    }

    constexpr explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

    auto operator<=>(const checked& other) const = default;

private:
    value_type data;
};

}

#endif /* checked_hpp */
