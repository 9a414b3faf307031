#ifndef expected_hpp
#define expected_hpp

#ifdef __has_include
# if __has_include(<version>)
#   include <version>
# endif
#endif

#if !defined(__has_include) || !__has_include(<expected>) \
    || !defined(__cplusplus) || (__cplusplus < 202300L)

#include <type_traits> // for std::is_convertible_v
#include <utility> // for std::move, std::forward
#include <variant> // for std::get, std::get_if

namespace berth {

template<class E>
struct unexpected {
    constexpr unexpected() = default;

    template<class Err = E, class X = std::enable_if_t<
        !std::is_same_v<std::remove_cvref_t<Err>, unexpected> &&
        std::is_constructible_v<E, Err>, E>>
    constexpr explicit unexpected(Err&& err):
        val{std::forward<Err>(err)} // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
    {
        // Intentionally empty.
    }

    [[nodiscard]] constexpr auto value() const& noexcept -> const E&
    {
        return val;
    }

    [[nodiscard]] constexpr auto value() && noexcept -> E&&
    {
        return std::move(val);
    }

private:
    E val;
};

/// @brief Subset of <code>std::expected</code> for C++20.
/// @note Only the members this library uses are provided. The value type
///   must be default constructible.
/// @see https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2021/p0323r11.html
template <class T, class E>
struct expected {
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    static_assert(std::is_default_constructible_v<T>);

    constexpr expected() = default;

    template<class U = T, class X = std::enable_if_t<
        !std::is_same_v<std::remove_cvref_t<U>, expected> &&
        std::is_constructible_v<T, U>, E>>
    constexpr explicit(!std::is_convertible_v<U, T>) expected(U&& v):
        m_value{std::in_place_index<0u>, std::forward<U>(v)}
    {
        // Intentionally empty.
    }

    template<class G>
    constexpr expected(const unexpected<G>& error):
        m_value{std::in_place_index<1u>, error.value()}
    {
        // Intentionally empty.
    }

    template<class G>
    constexpr expected(unexpected<G>&& error):
        m_value{std::in_place_index<1u>, std::move(error).value()}
    {
        // Intentionally empty.
    }

    constexpr auto operator*() const& noexcept -> const T&
    {
        return *std::get_if<0u>(&m_value);
    }

    constexpr auto operator*() & noexcept -> T&
    {
        return *std::get_if<0u>(&m_value);
    }

    constexpr auto operator*() && noexcept -> T&&
    {
        return std::move(*std::get_if<0u>(&m_value));
    }

    constexpr auto operator->() const noexcept -> const T*
    {
        return std::get_if<0u>(&m_value);
    }

    constexpr auto operator->() noexcept -> T*
    {
        return std::get_if<0u>(&m_value);
    }

    constexpr explicit operator bool() const noexcept
    {
        return m_value.index() == 0u;
    }

    [[nodiscard]] constexpr auto has_value() const noexcept -> bool
    {
        return m_value.index() == 0u;
    }

    constexpr auto value() const& -> const T& // NOLINT(modernize-use-nodiscard)
    {
        return std::get<0u>(m_value);
    }

    constexpr auto value() && -> T&& // NOLINT(modernize-use-nodiscard)
    {
        return std::move(std::get<0u>(m_value));
    }

    constexpr auto error() const& -> const E& // NOLINT(modernize-use-nodiscard)
    {
        return std::get<1u>(m_value);
    }

private:
    std::variant<T, E> m_value{std::in_place_index<0u>};
};

}

#else // presumably compiler supporting C++23

#include <expected>

namespace berth {
using std::unexpected;
using std::expected;
}

#endif

#endif /* expected_hpp */
