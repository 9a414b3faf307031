#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream> // for std::ostringstream, std::istringstream
#include <string>
#include <vector>

#include "berth/bring_up.hpp"
#include "berth/configuration_error.hpp"
#include "berth/dependency_order.hpp"

#include "test_directory.hpp"

namespace {

auto lines_of(const std::string& text) -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    std::istringstream is{text};
    auto line = std::string{};
    while (std::getline(is, line)) {
        result.push_back(line);
    }
    return result;
}

struct bring_up_fixture: ::testing::Test
{
    void SetUp() override
    {
        directory = test_directory("berth-bring-up");
        std::filesystem::create_directories(directory / "app");
        std::ofstream{directory / ".env"} << "POSTGRES_PASSWORD=secret\n";
        std::ofstream{directory / "app" / "devel.Dockerfile"}
            << "FROM scratch\n";

        auto db = berth::service{};
        db.name = "db";
        db.source = berth::image_source{"postgres:12"};
        db.env_files.push_back(".env");

        auto adminer = berth::service{};
        adminer.name = "adminer";
        adminer.source = berth::image_source{"adminer"};
        adminer.ports.push_back(*berth::parse_port_mapping("8080:8080"));
        adminer.depends_on.push_back(berth::dependency{"db"});

        auto backend = berth::service{};
        backend.name = "backend";
        backend.source = berth::build_source{"app", "devel.Dockerfile"};
        backend.depends_on.push_back(berth::dependency{"db"});

        p = berth::project{"test", directory, {db, adminer, backend}};
    }

    void TearDown() override
    {
        std::filesystem::remove_all(directory);
    }

    std::filesystem::path directory;
    berth::project p;
};

}

TEST(readiness, output)
{
    std::ostringstream os;
    os << berth::readiness::started << "," << berth::readiness::completed;
    EXPECT_EQ(os.str(), "started,completed");
}

TEST_F(bring_up_fixture, dry_run)
{
    std::ostringstream commands;
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.dry_run = &commands;
    const auto result = berth::bring_up(p, diags, opts);
    const auto app = (directory / "app").string();
    EXPECT_EQ(lines_of(commands.str()), (std::vector<std::string>{
        "docker network create test_default",
        "docker run -d --name test-db-1 --network test_default"
            " --network-alias db -e POSTGRES_PASSWORD=secret postgres:12",
        "docker build -f " + app + "/devel.Dockerfile -t test-backend " + app,
        "docker run -d --name test-adminer-1 --network test_default"
            " --network-alias adminer -p 8080:8080 adminer",
        "docker run -d --name test-backend-1 --network test_default"
            " --network-alias backend test-backend",
    }));
    EXPECT_EQ(result.project_name, "test");
    EXPECT_EQ(result.network, "test_default");
    EXPECT_EQ(result.started, (std::vector<berth::service_name>{
        "db", "adminer", "backend"
    }));
    EXPECT_NE(diags.str().find("building \"backend\""), std::string::npos);
}

TEST_F(bring_up_fixture, directory_is_per_test)
{
    const auto name = directory.filename().string();
    EXPECT_NE(name.find("directory_is_per_test"), std::string::npos);
    EXPECT_NE(name.find(std::to_string(::getpid())), std::string::npos);
    EXPECT_NE(directory, test_directory("berth-validate"));
}

TEST_F(bring_up_fixture, invalid_project_starts_nothing)
{
    p.services[1].depends_on.push_back(berth::dependency{"cache"});
    std::ostringstream commands;
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.dry_run = &commands;
    auto result = berth::deployment{};
    EXPECT_THROW(berth::bring_up(p, result, diags, opts),
                 berth::configuration_error);
    EXPECT_TRUE(commands.str().empty());
    EXPECT_TRUE(result.started.empty());
    EXPECT_TRUE(result.network.empty());
}

TEST_F(bring_up_fixture, succeeding_engine)
{
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.engine.program = "true";
    opts.ready = berth::readiness::completed;
    auto result = berth::bring_up(p, diags, opts);
    ASSERT_EQ(size(result.started), 3u);
    for (auto&& entry: result.services) {
        EXPECT_EQ(std::get<berth::wait_status>(entry.second.state),
                  berth::wait_status{berth::wait_exit_status{0}})
            << entry.first;
    }
    EXPECT_EQ(diags.str().find("warning"), std::string::npos) << diags.str();

    berth::tear_down(result, diags, opts);
    EXPECT_TRUE(result.started.empty());
    EXPECT_TRUE(result.services.empty());
    EXPECT_TRUE(result.network.empty());
    EXPECT_EQ(diags.str().find("warning"), std::string::npos) << diags.str();
}

TEST_F(bring_up_fixture, failing_run_command)
{
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.engine.program = "false";
    opts.ready = berth::readiness::completed;
    auto result = berth::deployment{};
    try {
        berth::bring_up(p, result, diags, opts);
        FAIL() << "expected start_error";
    }
    catch (const berth::start_error& ex) {
        EXPECT_EQ(ex.service, berth::service_name("db"));
        EXPECT_NE(std::string(ex.what()).find("run failed"),
                  std::string::npos);
    }
    // Network creation failing is only warned about.
    EXPECT_NE(diags.str().find("warning: false network create"),
              std::string::npos) << diags.str();
    EXPECT_EQ(result.started, (std::vector<berth::service_name>{"db"}));
    EXPECT_EQ(result.network, "test_default");
}

TEST_F(bring_up_fixture, failing_build)
{
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.engine.program = "false";
    auto result = berth::deployment{};
    try {
        berth::bring_up(p, result, diags, opts);
        FAIL() << "expected start_error";
    }
    catch (const berth::start_error& ex) {
        EXPECT_EQ(ex.service, berth::service_name("backend"));
        EXPECT_NE(std::string(ex.what()).find("build failed"),
                  std::string::npos);
    }
    // Dependents of db in the same wave aren't started before the build.
    EXPECT_EQ(result.started, (std::vector<berth::service_name>{"db"}));
    berth::tear_down(result, diags, opts);
    EXPECT_NE(diags.str().find("removing \"test-db-1\""), std::string::npos);
}

TEST_F(bring_up_fixture, missing_engine)
{
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.engine.program = "/no/such/engine";
    auto result = berth::deployment{};
    try {
        berth::bring_up(p, result, diags, opts);
        FAIL() << "expected start_error";
    }
    catch (const berth::start_error& ex) {
        EXPECT_TRUE(ex.service.get().empty());
    }
    EXPECT_TRUE(result.started.empty());
}

TEST_F(bring_up_fixture, dry_run_issues_start_sequence)
{
    auto cache = berth::service{};
    cache.name = "cache";
    cache.source = berth::image_source{"redis"};
    p.services.push_back(cache);
    std::ostringstream commands;
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.dry_run = &commands;
    const auto result = berth::bring_up(p, diags, opts);
    EXPECT_EQ(result.started, berth::start_sequence(p));
    EXPECT_EQ(result.started, (std::vector<berth::service_name>{
        "db", "cache", "adminer", "backend"
    }));
}

TEST_F(bring_up_fixture, tear_down_dry_run)
{
    std::ostringstream commands;
    std::ostringstream diags;
    auto opts = berth::bring_up_options{};
    opts.engine.program = "podman";
    opts.dry_run = &commands;
    berth::tear_down(p, diags, opts);
    EXPECT_EQ(lines_of(commands.str()), (std::vector<std::string>{
        "podman rm -f test-backend-1",
        "podman rm -f test-adminer-1",
        "podman rm -f test-db-1",
        "podman network rm test_default",
    }));
}
