#include <gtest/gtest.h>

#include "berth/env_name.hpp"

TEST(env_name, default_construction)
{
    EXPECT_NO_THROW(berth::env_name());
    EXPECT_TRUE(berth::env_name().get().empty());
}

TEST(env_name, construction)
{
    EXPECT_NO_THROW(berth::env_name());
    EXPECT_NO_THROW(berth::env_name("PATH"));
    EXPECT_NO_THROW(berth::env_name("HOME"));

    EXPECT_THROW(berth::env_name("=FOO"), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("FOO="), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("=BAR"), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("BAR="), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("FOO=BAR"), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("="), berth::charset_validator_error);
    EXPECT_THROW(berth::env_name("=="), berth::charset_validator_error);

    EXPECT_THROW(berth::env_name(std::string{'\0'}),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::env_name(std::string{'\0', '\0'}),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::env_name(std::string{'A', '\0'}),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::env_name(std::string{'\0', 'c'}),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::env_name(std::string{'a', '\0', 'b'}),
                 berth::charset_validator_error);
    EXPECT_THROW(berth::env_name(std::string{'a', '=', 'b'}),
                 berth::charset_validator_error);

    const auto good_string = std::string{'a', 'b', 'c'};
    const auto bad_string = std::string{'a', '=', '\0', 'b'};
    EXPECT_NO_THROW(berth::env_name(good_string.begin(), good_string.end()));
    EXPECT_THROW(berth::env_name(bad_string.begin(), bad_string.end()),
                 berth::charset_validator_error);
}

TEST(env_name, ordering)
{
    EXPECT_TRUE(berth::env_name("A") < berth::env_name("B"));
    EXPECT_FALSE(berth::env_name("B") < berth::env_name("A"));
    EXPECT_EQ(berth::env_name("PATH"), std::string("PATH"));
}
