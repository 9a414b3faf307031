#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <vector>

#include "berth/engine.hpp"

#include "test_directory.hpp"

namespace {

auto make_example() -> berth::project
{
    auto db = berth::service{};
    db.name = "db";
    db.source = berth::image_source{"postgres:12.13-alpine"};
    db.ports.push_back(*berth::parse_port_mapping("5432:5432"));
    db.ports.push_back(*berth::parse_port_mapping("9999/udp"));
    db.environment.emplace("POSTGRES_USER", "postgres");

    auto backend = berth::service{};
    backend.name = "Backend";
    backend.source = berth::build_source{"app", "devel.Dockerfile"};
    backend.volumes.push_back(berth::volume_binding{"/srv/app", "/app", "z"});
    backend.command = {"python", "manage.py", "runserver"};
    return berth::project{"demo", "/work", {db, backend}};
}

}

TEST(engine, names)
{
    const auto p = make_example();
    EXPECT_EQ(berth::container_name(p, p.services[0]), "demo-db-1");
    EXPECT_EQ(berth::container_name(p, p.services[1]), "demo-Backend-1");
    EXPECT_EQ(berth::image_name(p, p.services[1]), "demo-backend");
    EXPECT_EQ(berth::network_name(p), "demo_default");
}

TEST(engine, make_network_create)
{
    const auto p = make_example();
    const auto exe = berth::make_network_create(p, {});
    EXPECT_EQ(exe.file, std::filesystem::path("docker"));
    EXPECT_EQ(exe.arguments, (std::vector<std::string>{
        "docker", "network", "create", "demo_default"
    }));
    EXPECT_TRUE(exe.working_directory.empty());
}

TEST(engine, make_build_command)
{
    const auto p = make_example();
    const auto exe = berth::make_build_command(p, p.services[1],
                                               {"podman"});
    EXPECT_EQ(exe.file, std::filesystem::path("podman"));
    EXPECT_EQ(exe.arguments, (std::vector<std::string>{
        "podman", "build",
        "-f", "/work/app/devel.Dockerfile",
        "-t", "demo-backend",
        "/work/app",
    }));
    EXPECT_THROW(berth::make_build_command(p, p.services[0], {}),
                 std::invalid_argument);
}

TEST(engine, make_run_command_for_image)
{
    const auto p = make_example();
    const auto env = berth::service_environment(p, p.services[0]);
    const auto exe = berth::make_run_command(p, p.services[0], env, {});
    EXPECT_EQ(exe.arguments, (std::vector<std::string>{
        "docker", "run", "-d",
        "--name", "demo-db-1",
        "--network", "demo_default",
        "--network-alias", "db",
        "-e", "POSTGRES_USER=postgres",
        "-p", "5432:5432",
        "--expose", "9999/udp",
        "postgres:12.13-alpine",
    }));
}

TEST(engine, make_run_command_for_build)
{
    const auto p = make_example();
    const auto exe = berth::make_run_command(p, p.services[1], {}, {});
    EXPECT_EQ(exe.arguments, (std::vector<std::string>{
        "docker", "run", "-d",
        "--name", "demo-Backend-1",
        "--network", "demo_default",
        "--network-alias", "Backend",
        "-v", "/srv/app:/app:z",
        "demo-backend",
        "python", "manage.py", "runserver",
    }));
}

TEST(engine, make_remove_commands)
{
    const auto opts = berth::engine_options{"/usr/bin/podman"};
    EXPECT_EQ(berth::make_remove_command("demo-db-1", opts).arguments,
              (std::vector<std::string>{
                  "/usr/bin/podman", "rm", "-f", "demo-db-1"
              }));
    EXPECT_EQ(berth::make_network_remove("demo_default", opts).arguments,
              (std::vector<std::string>{
                  "/usr/bin/podman", "network", "rm", "demo_default"
              }));
}

TEST(engine, service_environment)
{
    const auto dir = test_directory("berth-engine");
    std::filesystem::create_directories(dir);
    std::ofstream{dir / "first.env"} << "A=1\nB=2\n";
    std::ofstream{dir / "second.env"} << "# comment\nB=3\nC=4\n";

    auto s = berth::service{};
    s.name = "app";
    s.source = berth::image_source{"busybox"};
    s.env_files = {"first.env", "second.env"};
    s.environment.emplace("C", "5");
    const auto p = berth::project{"demo", dir, {s}};

    const auto env = berth::service_environment(p, p.services[0]);
    EXPECT_EQ(env, (berth::environment_map{
        {"A", "1"}, {"B", "3"}, {"C", "5"},
    }));
    std::filesystem::remove_all(dir);
}
