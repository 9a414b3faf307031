#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream
#include <vector>

#include "berth/service_name.hpp"

TEST(service_name, default_construction)
{
    EXPECT_NO_THROW(berth::service_name());
    EXPECT_TRUE(berth::service_name().get().empty());
}

TEST(service_name, construction)
{
    EXPECT_NO_THROW(berth::service_name("db"));
    EXPECT_NO_THROW(berth::service_name("adminer"));
    EXPECT_NO_THROW(berth::service_name("back_end-2.x"));
    EXPECT_NO_THROW(berth::service_name("Backend"));

    EXPECT_THROW(berth::service_name("back end"),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::service_name("db:1"),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::service_name("a/b"),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::service_name(std::string{'a', '\0'}),
                 berth::charset_validator_error);
}

TEST(service_name, comparison)
{
    EXPECT_EQ(berth::service_name("db"), berth::service_name("db"));
    EXPECT_NE(berth::service_name("db"), berth::service_name("backend"));
    EXPECT_TRUE(berth::service_name("backend") < berth::service_name("db"));
}

TEST(service_name, write)
{
    const auto names = std::vector<berth::service_name>{"db", "adminer"};
    std::ostringstream os;
    berth::write(os, names);
    EXPECT_EQ(os.str(), "db, adminer");
    os.str({});
    berth::write(os, names, " -> ");
    EXPECT_EQ(os.str(), "db -> adminer");
    os.str({});
    berth::write(os, std::vector<berth::service_name>{});
    EXPECT_EQ(os.str(), "");
}
