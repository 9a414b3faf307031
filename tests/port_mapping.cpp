#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "berth/port_mapping.hpp"

namespace {

auto to_string(const berth::port_mapping& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

}

TEST(port_mapping, default_construction)
{
    const auto value = berth::port_mapping{};
    EXPECT_TRUE(value.host_ip.empty());
    EXPECT_EQ(value.host_port, 0u);
    EXPECT_EQ(value.container_port, 0u);
    EXPECT_EQ(value.protocol, berth::transport::tcp);
    EXPECT_FALSE(berth::is_published(value));
}

TEST(parse_port_mapping, container_only)
{
    const auto result = berth::parse_port_mapping("5432");
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->container_port, 5432u);
    EXPECT_EQ(result->host_port, 0u);
    EXPECT_FALSE(berth::is_published(*result));
}

TEST(parse_port_mapping, host_and_container)
{
    const auto result = berth::parse_port_mapping("8000:80");
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->host_port, 8000u);
    EXPECT_EQ(result->container_port, 80u);
    EXPECT_TRUE(result->host_ip.empty());
    EXPECT_EQ(to_string(*result), "8000:80");
}

TEST(parse_port_mapping, with_host_ip)
{
    const auto result = berth::parse_port_mapping("127.0.0.1:5432:5432");
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->host_ip, "127.0.0.1");
    EXPECT_EQ(result->host_port, 5432u);
    EXPECT_EQ(to_string(*result), "127.0.0.1:5432:5432");

    const auto v6 = berth::parse_port_mapping("[::1]:8080:8080/udp");
    ASSERT_TRUE(v6) << v6.error();
    EXPECT_EQ(v6->host_ip, "::1");
    EXPECT_EQ(v6->protocol, berth::transport::udp);
    EXPECT_EQ(to_string(*v6), "[::1]:8080:8080/udp");
}

TEST(parse_port_mapping, protocol)
{
    EXPECT_EQ(berth::parse_port_mapping("53:53/udp")->protocol,
              berth::transport::udp);
    EXPECT_EQ(berth::parse_port_mapping("80/tcp")->protocol,
              berth::transport::tcp);
    EXPECT_FALSE(berth::parse_port_mapping("80/sctp"));
}

TEST(parse_port_mapping, errors)
{
    EXPECT_FALSE(berth::parse_port_mapping(""));
    EXPECT_FALSE(berth::parse_port_mapping("http"));
    EXPECT_FALSE(berth::parse_port_mapping("0"));
    EXPECT_FALSE(berth::parse_port_mapping("65536"));
    EXPECT_FALSE(berth::parse_port_mapping("80:"));
    EXPECT_FALSE(berth::parse_port_mapping(":80"));
    EXPECT_FALSE(berth::parse_port_mapping("[::1:80:80"));
}

TEST(parse_port_number, range)
{
    EXPECT_EQ(*berth::parse_port_number("1"), 1u);
    EXPECT_EQ(*berth::parse_port_number("65535"), 65535u);
    EXPECT_FALSE(berth::parse_port_number("0"));
    EXPECT_FALSE(berth::parse_port_number("-1"));
    EXPECT_FALSE(berth::parse_port_number("12a"));
}

TEST(port_mapping, conflicts)
{
    const auto a = *berth::parse_port_mapping("8080:80");
    const auto b = *berth::parse_port_mapping("8080:8080");
    const auto c = *berth::parse_port_mapping("8080:80/udp");
    const auto d = *berth::parse_port_mapping("127.0.0.1:8080:80");
    const auto e = *berth::parse_port_mapping("127.0.0.2:8080:80");
    const auto f = *berth::parse_port_mapping("80");
    EXPECT_TRUE(berth::conflicts(a, b));
    EXPECT_FALSE(berth::conflicts(a, c));
    EXPECT_TRUE(berth::conflicts(a, d));
    EXPECT_FALSE(berth::conflicts(d, e));
    EXPECT_TRUE(berth::conflicts(d, d));
    EXPECT_FALSE(berth::conflicts(f, f));
}

TEST(port_mapping, conflicts_with_wildcard_address)
{
    const auto any4 = *berth::parse_port_mapping("0.0.0.0:8080:80");
    const auto any6 = *berth::parse_port_mapping("[::]:8080:80");
    const auto local = *berth::parse_port_mapping("127.0.0.1:8080:80");
    const auto other = *berth::parse_port_mapping("127.0.0.1:9090:80");
    EXPECT_TRUE(berth::conflicts(any4, local));
    EXPECT_TRUE(berth::conflicts(local, any6));
    EXPECT_TRUE(berth::conflicts(any4, any6));
    EXPECT_FALSE(berth::conflicts(any4, other));
}
