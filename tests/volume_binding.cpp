#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "berth/volume_binding.hpp"

TEST(parse_volume_binding, with_mode)
{
    const auto result = berth::parse_volume_binding("./:/usr/src/app:z");
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->source, "./");
    EXPECT_EQ(result->target, "/usr/src/app");
    EXPECT_EQ(result->mode, "z");
    EXPECT_TRUE(berth::is_host_path(*result));
}

TEST(parse_volume_binding, named_volume)
{
    const auto result = berth::parse_volume_binding("pgdata:/var/lib/postgresql/data");
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->source, "pgdata");
    EXPECT_TRUE(result->mode.empty());
    EXPECT_FALSE(berth::is_host_path(*result));
}

TEST(volume_binding, is_host_path)
{
    EXPECT_TRUE(berth::is_host_path({"/srv/data", "/data", ""}));
    EXPECT_TRUE(berth::is_host_path({"../data", "/data", ""}));
    EXPECT_FALSE(berth::is_host_path({"~/data", "/data", ""}));
    EXPECT_FALSE(berth::is_host_path({"data", "/data", ""}));
    const auto home = berth::volume_binding{"~/data", "/data", ""};
    EXPECT_EQ(berth::resolve(home, "/project"), home);
}

TEST(parse_volume_binding, errors)
{
    EXPECT_FALSE(berth::parse_volume_binding("/only"));
    EXPECT_FALSE(berth::parse_volume_binding(":/target"));
    EXPECT_FALSE(berth::parse_volume_binding("src:relative"));
    EXPECT_FALSE(berth::parse_volume_binding("src:/target:"));
}

TEST(volume_binding, resolve)
{
    const auto dir = std::filesystem::path{"/home/user/project"};
    const auto here = berth::resolve(*berth::parse_volume_binding("./:/app:z"), dir);
    EXPECT_EQ(here.source, "/home/user/project");
    const auto sub = berth::resolve(*berth::parse_volume_binding("./data:/data"), dir);
    EXPECT_EQ(sub.source, "/home/user/project/data");
    const auto up = berth::resolve(*berth::parse_volume_binding("../x:/x"), dir);
    EXPECT_EQ(up.source, "/home/user/x");
    const auto named = berth::resolve(*berth::parse_volume_binding("v:/v"), dir);
    EXPECT_EQ(named.source, "v");
    const auto absolute = berth::resolve(*berth::parse_volume_binding("/etc:/etc:ro"), dir);
    EXPECT_EQ(absolute.source, "/etc");
}

TEST(volume_binding, output)
{
    std::ostringstream os;
    os << berth::volume_binding{"/src", "/dst", "ro"};
    EXPECT_EQ(os.str(), "/src:/dst:ro");
    os.str({});
    os << berth::volume_binding{"v", "/dst", ""};
    EXPECT_EQ(os.str(), "v:/dst");
}
