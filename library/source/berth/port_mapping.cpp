#include <charconv> // for std::from_chars
#include <iomanip> // for std::quoted
#include <limits>
#include <sstream> // for std::ostringstream

#include "berth/port_mapping.hpp"

namespace berth {

namespace {

constexpr auto protocol_separator = '/';
constexpr auto field_separator = ':';

auto invalid(std::string_view what, std::string_view string)
    -> unexpected<std::string>
{
    std::ostringstream os;
    os << what << " in port mapping " << std::quoted(string);
    return unexpected<std::string>{os.str()};
}

/// @brief Whether the host address means every host address.
auto is_wildcard(const std::string& host_ip) -> bool
{
    return host_ip.empty()
        || (host_ip == "0.0.0.0")
        || (host_ip == "::")
        || (host_ip == "[::]");
}

}

auto operator<<(std::ostream& os, transport value) -> std::ostream&
{
    switch (value) {
    case transport::tcp:
        os << "tcp";
        break;
    case transport::udp:
        os << "udp";
        break;
    }
    return os;
}

auto to_transport(std::string_view string) -> std::optional<transport>
{
    if (string == "tcp") {
        return transport::tcp;
    }
    if (string == "udp") {
        return transport::udp;
    }
    return {};
}

auto operator<<(std::ostream& os, const port_mapping& value)
    -> std::ostream&
{
    if (!value.host_ip.empty()) {
        if (value.host_ip.find(field_separator) != std::string::npos) {
            os << '[' << value.host_ip << ']';
        }
        else {
            os << value.host_ip;
        }
        os << field_separator;
    }
    if (is_published(value)) {
        os << value.host_port << field_separator;
    }
    os << value.container_port;
    if (value.protocol != transport::tcp) {
        os << protocol_separator << value.protocol;
    }
    return os;
}

auto conflicts(const port_mapping& lhs, const port_mapping& rhs) -> bool
{
    if (!is_published(lhs) || !is_published(rhs)) {
        return false;
    }
    if ((lhs.host_port != rhs.host_port) || (lhs.protocol != rhs.protocol)) {
        return false;
    }
    return is_wildcard(lhs.host_ip) || is_wildcard(rhs.host_ip)
        || (lhs.host_ip == rhs.host_ip);
}

auto parse_port_number(std::string_view string)
    -> expected<std::uint16_t, std::string>
{
    auto number = 0u;
    const auto first = data(string);
    const auto last = first + size(string);
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if ((ec != std::errc{}) || (ptr != last)) {
        std::ostringstream os;
        os << "invalid port number " << std::quoted(string);
        return unexpected<std::string>{os.str()};
    }
    if ((number == 0u) || (number > std::numeric_limits<std::uint16_t>::max())) {
        std::ostringstream os;
        os << "port number " << number << " out of range";
        return unexpected<std::string>{os.str()};
    }
    return static_cast<std::uint16_t>(number);
}

auto parse_port_mapping(std::string_view string)
    -> expected<port_mapping, std::string>
{
    auto result = port_mapping{};
    auto rest = string;
    if (const auto found = rest.rfind(protocol_separator);
        found != std::string_view::npos) {
        const auto protocol = to_transport(rest.substr(found + 1u));
        if (!protocol) {
            return invalid("unknown protocol", string);
        }
        result.protocol = *protocol;
        rest = rest.substr(0u, found);
    }
    if (rest.starts_with('[')) {
        const auto close = rest.find(']');
        if ((close == std::string_view::npos) ||
            (close + 1u >= size(rest)) ||
            (rest[close + 1u] != field_separator)) {
            return invalid("malformed host address", string);
        }
        result.host_ip = std::string{rest.substr(1u, close - 1u)};
        rest = rest.substr(close + 2u);
    }
    else if (const auto first = rest.find(field_separator),
             last = rest.rfind(field_separator);
             (first != std::string_view::npos) && (first != last)) {
        result.host_ip = std::string{rest.substr(0u, first)};
        rest = rest.substr(first + 1u);
    }
    auto container_part = rest;
    if (const auto found = rest.find(field_separator);
        found != std::string_view::npos) {
        const auto host_port = parse_port_number(rest.substr(0u, found));
        if (!host_port) {
            return unexpected<std::string>{host_port.error()};
        }
        result.host_port = *host_port;
        container_part = rest.substr(found + 1u);
    }
    else if (!result.host_ip.empty()) {
        return invalid("host address without host port", string);
    }
    const auto container_port = parse_port_number(container_part);
    if (!container_port) {
        return unexpected<std::string>{container_port.error()};
    }
    result.container_port = *container_port;
    return result;
}

}
