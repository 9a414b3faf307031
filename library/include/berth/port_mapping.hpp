#ifndef port_mapping_hpp
#define port_mapping_hpp

#include <cstdint> // for std::uint16_t
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "ext/expected.hpp"

namespace berth {

enum class transport { tcp, udp };

auto operator<<(std::ostream& os, transport value) -> std::ostream&;

auto to_transport(std::string_view string) -> std::optional<transport>;

/// @brief Published port of a service.
/// @note A <code>host_port</code> of zero means the container port isn't
///   published on the host.
struct port_mapping
{
    /// @brief Host address to bind to.
    /// @note Empty means all host addresses.
    std::string host_ip;

    std::uint16_t host_port{};

    std::uint16_t container_port{};

    transport protocol{transport::tcp};
};

inline auto operator==(const port_mapping& lhs,
                       const port_mapping& rhs) noexcept -> bool
{
    return (lhs.host_ip == rhs.host_ip)
        && (lhs.host_port == rhs.host_port)
        && (lhs.container_port == rhs.container_port)
        && (lhs.protocol == rhs.protocol);
}

/// @brief Writes the mapping in the short <code>[IP:]H:C[/udp]</code>
///   syntax.
auto operator<<(std::ostream& os, const port_mapping& value)
    -> std::ostream&;

inline auto is_published(const port_mapping& value) noexcept -> bool
{
    return value.host_port != 0u;
}

/// @brief Whether the two mappings claim the same host port.
/// @note An empty host address, <code>0.0.0.0</code>, and <code>::</code>
///   all mean every host address, so conflict with any other address.
///   Mappings on different specific host addresses don't conflict.
///   Neither do unpublished mappings.
auto conflicts(const port_mapping& lhs, const port_mapping& rhs) -> bool;

/// @brief Parses the short syntax of a port mapping.
/// @details Accepts <code>C</code>, <code>H:C</code>, and
///   <code>IP:H:C</code>, each with an optional <code>/tcp</code> or
///   <code>/udp</code> suffix. Bracketed IPv6 host addresses are accepted.
auto parse_port_mapping(std::string_view string)
    -> expected<port_mapping, std::string>;

/// @brief Parses a port number in the range 1 to 65535.
auto parse_port_number(std::string_view string)
    -> expected<std::uint16_t, std::string>;

}

#endif /* port_mapping_hpp */
