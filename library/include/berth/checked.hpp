#ifndef checked_hpp
#define checked_hpp

#include <ostream>
#include <type_traits>
#include <utility> // for std::exchange

namespace berth::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Value of type <code>T</code> that's only ever holding what
///   <code>Checker</code> let through.
/// @note <code>Checker</code> is called with no arguments to get the
///   default value, and with the constructing argument(s) otherwise. It
///   throws to reject a value.
template <class T, functor_returns<T> Checker>
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

    checked(const checked& other) = default;

    checked(checked&& other) // NOLINT(bugprone-exception-escape)
    noexcept(std::is_nothrow_move_constructible_v<value_type> &&
             noexcept(Checker{}())):
        data{std::exchange(other.data, checker_type{}())}
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

    template<class InputIt, class U = std::enable_if_t<
        std::is_invocable_r_v<T, Checker, InputIt, InputIt>
    >>
    checked(InputIt first, InputIt last)
        : data{checker_type{}(first, last)}
    {
        // Intentionally empty.
    }

    auto operator=(const checked& other) -> checked& = default;

    auto operator=(checked&& other) // NOLINT(bugprone-exception-escape)
        noexcept(std::is_nothrow_move_assignable_v<value_type> &&
                 noexcept(Checker{}()))
        -> checked&
    {
        if (this != &other) {
            data = std::exchange(other.data, checker_type{}());
        }
        return *this;
    }

    constexpr explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

private:
    value_type data;
};

template <class V, class C>
inline auto operator==(const checked<V, C>& lhs, const checked<V, C>& rhs)
    -> decltype(lhs.get() == rhs.get())
{
    return lhs.get() == rhs.get();
}

template <class V, class C>
inline auto operator<(const checked<V, C>& lhs, const checked<V, C>& rhs)
    -> decltype(lhs.get() < rhs.get())
{
    return lhs.get() < rhs.get();
}

template <class V, class C>
inline auto operator==(const checked<V, C>& lhs, const V& rhs)
    -> decltype(lhs.get() == rhs)
{
    return lhs.get() == rhs;
}

template <class V, class C>
inline auto operator==(const V& lhs, const checked<V, C>& rhs)
    -> decltype(lhs == rhs.get())
{
    return lhs == rhs.get();
}

template <class T>
concept ostreamable = requires{
    std::declval<std::ostream&>() << std::declval<T>();
};

template <ostreamable T, class C>
auto operator<<(std::ostream& os, const checked<T, C>& value)
    -> std::ostream&
{
    os << value.get();
    return os;
}

}

#endif /* checked_hpp */
