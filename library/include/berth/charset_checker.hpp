#ifndef charset_checker_hpp
#define charset_checker_hpp

#include <array>
#include <concepts> // for std::convertible_to
#include <set>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

namespace berth {

enum class char_list { deny, allow };

struct charset_validator_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;

    charset_validator_error(char badc,
                            std::string chars,
                            char_list acc,
                            const std::string& what_arg = {});

    [[nodiscard]] auto badchar() const noexcept -> char;
    [[nodiscard]] auto access() const noexcept -> char_list;
    [[nodiscard]] auto charset() const -> std::string;

private:
    std::string chars_;
    char_list access_{char_list::deny};
    char badchar_{};
};

}

namespace berth::detail {

/// @brief Compile-time character string.
template <char... chars>
struct tcstring
{
    static constexpr auto begin() noexcept
    {
        return std::begin(ntbs);
    }

    static constexpr auto end() noexcept
    {
        return std::end(ntbs) - 1u;
    }

    constexpr operator std::string_view() const noexcept
    {
        return std::string_view{std::data(ntbs), sizeof...(chars)};
    }

private:
    static constexpr auto ntbs = std::array<char, sizeof...(chars) + 1u>{
        chars..., '\0'
    };
};

template <class...> struct tcstring_joiner;

template <char ...Args1>
struct tcstring_joiner<tcstring<Args1...>>
{
    using type = tcstring<Args1...>;
};

template <char ...Args1, char ...Args2, class ...Tail>
struct tcstring_joiner<tcstring<Args1...>, tcstring<Args2...>, Tail...>
{
    using type =
        typename tcstring_joiner<tcstring<Args1..., Args2...>, Tail...>::type;
};

template <class ...Ts>
using tcstring_join = typename tcstring_joiner<Ts...>::type;

/// @brief Character set validator function.
/// @param[in] v Value to validate.
/// @param[in] access Whether validation is to deny or allow finding of a
///   character from @chars.
/// @param[in] chars Characters which @v should be assessed for having or not.
/// @throws charset_validator_error if @v is invalid.
auto charset_validator(std::string v,
                       char_list access,
                       const std::string& chars)
    -> std::string;

template <class T, class U>
concept is_iterable_of = requires(T t)
{
    requires std::convertible_to<decltype(*std::begin(t)), U>;
    requires std::convertible_to<decltype(*std::end(t)), U>;
};

template <is_iterable_of<char>... Args>
auto make_charset(Args const&... args) -> std::string
{
    auto set = std::set<char>{};
    (set.insert(std::begin(args), std::end(args)), ...);
    return {std::begin(set), std::end(set)};
}

template <char_list access, is_iterable_of<char>... Charsets>
struct charset_checker
{
    static inline const auto charset = make_charset(Charsets{}...);

    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return charset_validator(std::move(v), access, charset);
    }

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }

    template <class InputIt>
    auto operator()(InputIt first, InputIt last) const -> std::string
    {
        return operator()(std::string{first, last});
    }
};

template <is_iterable_of<char>... Charsets>
using denied_chars_checker = charset_checker<char_list::deny, Charsets...>;

template <is_iterable_of<char>... Charsets>
using allowed_chars_checker = charset_checker<char_list::allow, Charsets...>;

using upper_charset = tcstring<
    'A','B','C','D','E','F','G','H','I','J','K','L','M',
    'N','O','P','Q','R','S','T','U','V','W','X','Y','Z'
>;

using lower_charset = tcstring<
    'a','b','c','d','e','f','g','h','i','j','k','l','m',
    'n','o','p','q','r','s','t','u','v','w','x','y','z'
>;

using digit_charset = tcstring<
    '0','1','2','3','4','5','6','7','8','9'
>;

using alphanum_charset = tcstring_join<
    upper_charset, lower_charset, digit_charset
>;

/// @brief Characters allowed in names of services.
using service_charset = tcstring_join<
    alphanum_charset, tcstring<'_','-','.'>
>;

}

#endif /* charset_checker_hpp */
