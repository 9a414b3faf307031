#ifndef service_name_hpp
#define service_name_hpp

#include <concepts> // for std::regular.
#include <ostream>
#include <string>

#include "berth/checked.hpp"
#include "berth/charset_checker.hpp"

namespace berth {

struct service_name_checker:
    detail::allowed_chars_checker<detail::service_charset>
{
};

/// @brief Service name.
/// @details A lexical token for identifying a <code>service</code> within
///   a <code>project</code>.
/// @note This is a strongly typed <code>std::string</code> that can be
///   constructed from strings containing only letters, digits, and the
///   characters '_', '-', and '.'. A <code>charset_validator_error</code>
///   exception is thrown otherwise.
/// @see service.
using service_name = detail::checked<std::string, service_name_checker>;

static_assert(std::regular<service_name>);

template <class T>
concept is_service_name_range = requires(const T& x)
{
    {*begin(x)} -> std::convertible_to<const service_name&>;
};

/// @brief Writes the given names separated by <code>separator</code>.
template <is_service_name_range T>
auto write(std::ostream& os, const T& names, const char* separator = ", ")
    -> std::ostream&
{
    auto prefix = "";
    for (auto&& name: names) {
        os << prefix << name.get();
        prefix = separator;
    }
    return os;
}

}

#endif /* service_name_hpp */
