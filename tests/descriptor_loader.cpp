#include <gtest/gtest.h>

#include <fstream>
#include <sstream> // for std::istringstream, std::ostringstream

#include "berth/configuration_error.hpp"
#include "berth/descriptor_loader.hpp"

#include "test_directory.hpp"

namespace {

constexpr auto example_descriptor = R"(
services:

  db:
    image: postgres:12.13-alpine
    env_file:
      - .env
    ports:
      - 5432:5432

  adminer:
    image: adminer:latest
    ports:
      - 8080:8080
    depends_on:
      - db

  backend:
    build:
      context: .
      dockerfile: ./devel.Dockerfile
    ports:
      - "8000:8000"
    depends_on:
      - db
    env_file:
      - .env
    volumes:
      - ./:/usr/src/app:z
)";

auto load(const std::string& text, std::ostream& diags,
          berth::load_options opts = {}) -> berth::project
{
    if (opts.directory.empty()) {
        opts.directory = "/srv/app";
    }
    std::istringstream is{text};
    return berth::load_project(is, diags, opts);
}

auto load(const std::string& text) -> berth::project
{
    std::ostringstream diags;
    return load(text, diags);
}

auto error_of(const std::string& text) -> std::string
{
    try {
        (void) load(text);
    }
    catch (const berth::configuration_error& ex) {
        return ex.what();
    }
    return {};
}

}

TEST(load_project, example)
{
    std::ostringstream diags;
    const auto p = load(example_descriptor, diags);
    EXPECT_TRUE(diags.str().empty()) << diags.str();
    EXPECT_EQ(p.name, "app");
    EXPECT_EQ(p.directory, std::filesystem::path("/srv/app"));
    ASSERT_EQ(size(p.services), 3u);

    const auto& db = p.services[0];
    EXPECT_EQ(db.name, berth::service_name("db"));
    ASSERT_TRUE(std::holds_alternative<berth::image_source>(db.source));
    EXPECT_EQ(std::get<berth::image_source>(db.source).reference,
              "postgres:12.13-alpine");
    ASSERT_EQ(size(db.ports), 1u);
    EXPECT_EQ(db.ports[0], (berth::port_mapping{"", 5432u, 5432u}));
    ASSERT_EQ(size(db.env_files), 1u);
    EXPECT_EQ(db.env_files[0], std::filesystem::path("/srv/app/.env"));
    EXPECT_TRUE(db.depends_on.empty());

    const auto& adminer = p.services[1];
    EXPECT_EQ(adminer.name, berth::service_name("adminer"));
    ASSERT_EQ(size(adminer.depends_on), 1u);
    EXPECT_EQ(adminer.depends_on[0].name, berth::service_name("db"));
    EXPECT_EQ(adminer.depends_on[0].condition,
              berth::dependency_condition::service_started);

    const auto& backend = p.services[2];
    ASSERT_TRUE(std::holds_alternative<berth::build_source>(backend.source));
    const auto& build = std::get<berth::build_source>(backend.source);
    EXPECT_EQ(build.context, std::filesystem::path("/srv/app"));
    EXPECT_EQ(berth::dockerfile_path(build, p.directory),
              std::filesystem::path("/srv/app/devel.Dockerfile"));
    ASSERT_EQ(size(backend.volumes), 1u);
    EXPECT_EQ(backend.volumes[0],
              (berth::volume_binding{"/srv/app", "/usr/src/app", "z"}));
    EXPECT_TRUE(berth::depends_on(backend, berth::service_name("db")));
}

TEST(load_project, project_name)
{
    const auto text = std::string{"name: My_Project\nservices:\n  a:\n    image: x\n"};
    EXPECT_EQ(load(text).name, "my_project");
    std::ostringstream diags;
    auto opts = berth::load_options{};
    opts.project_name = "Other";
    EXPECT_EQ(load(text, diags, opts).name, "other");
}

TEST(load_project, long_syntax)
{
    const auto p = load(R"(
services:
  web:
    image: nginx
    ports:
      - target: 80
        published: 8080
        host_ip: 127.0.0.1
        protocol: udp
      - 443
    volumes:
      - type: bind
        source: /etc/nginx
        target: /etc/nginx
        read_only: true
    environment:
      - MODE=production
      - EMPTY=
    command: nginx -g "daemon off;"
  worker:
    image: busybox
    environment:
      LEVEL: 3
    depends_on:
      web:
        condition: service_completed_successfully
    command: [sh, -c, "echo hi"]
)");
    ASSERT_EQ(size(p.services), 2u);
    const auto& web = p.services[0];
    ASSERT_EQ(size(web.ports), 2u);
    EXPECT_EQ(web.ports[0],
              (berth::port_mapping{"127.0.0.1", 8080u, 80u,
                                   berth::transport::udp}));
    EXPECT_EQ(web.ports[1], (berth::port_mapping{"", 0u, 443u}));
    ASSERT_EQ(size(web.volumes), 1u);
    EXPECT_EQ(web.volumes[0].mode, "ro");
    EXPECT_EQ(web.environment.at(berth::env_name{"MODE"}),
              std::string("production"));
    EXPECT_EQ(web.environment.at(berth::env_name{"EMPTY"}), std::string(""));
    EXPECT_EQ(web.command.front(), "nginx");

    const auto& worker = p.services[1];
    EXPECT_EQ(worker.environment.at(berth::env_name{"LEVEL"}),
              std::string("3"));
    ASSERT_EQ(size(worker.depends_on), 1u);
    EXPECT_EQ(worker.depends_on[0].condition,
              berth::dependency_condition::service_completed_successfully);
    EXPECT_EQ(worker.command,
              (std::vector<std::string>{"sh", "-c", "echo hi"}));
}

TEST(load_project, environment_from_caller)
{
    auto opts = berth::load_options{};
    opts.environment[berth::env_name{"TOKEN"}] = berth::env_value{"abc"};
    std::ostringstream diags;
    const auto p = load(R"(
services:
  a:
    image: x
    environment:
      - TOKEN
      - MISSING
)", diags, opts);
    const auto& env = p.services[0].environment;
    EXPECT_EQ(env.at(berth::env_name{"TOKEN"}), std::string("abc"));
    EXPECT_EQ(env.count(berth::env_name{"MISSING"}), 0u);
    EXPECT_NE(diags.str().find("MISSING"), std::string::npos);
}

TEST(load_project, warnings)
{
    std::ostringstream diags;
    const auto p = load(R"(
version: "3.8"
volumes:
  data:
services:
  a:
    image: x
    restart: always
  b:
    image: y
    depends_on:
      a:
        condition: service_healthy
)", diags);
    EXPECT_EQ(size(p.services), 2u);
    const auto text = diags.str();
    EXPECT_EQ(text.find("version"), std::string::npos);
    EXPECT_NE(text.find("\"volumes\""), std::string::npos);
    EXPECT_NE(text.find("\"restart\""), std::string::npos);
    EXPECT_NE(text.find("service_healthy"), std::string::npos);
}

TEST(load_project, errors)
{
    EXPECT_THROW(load("services: ["), berth::configuration_error);
    EXPECT_THROW(load("- a\n- b\n"), berth::configuration_error);
    EXPECT_NE(error_of("name: x\n").find("no services declared"),
              std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    ports: []\n")
              .find("neither image nor build given"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    image: x\n    build: .\n")
              .find("mutually exclusive"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    image: \"\"\n")
              .find("empty image reference"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a b:\n    image: x\n")
              .find("invalid service name"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    image: x\n    ports: [\"x:80\"]\n")
              .find("invalid port number"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    image: x\n    volumes: [\"/x\"]\n")
              .find("missing container path"), std::string::npos);
    EXPECT_NE(error_of("services:\n  a:\n    image: x\n    depends_on: [\"b c\"]\n")
              .find("invalid dependency name"), std::string::npos);
}

TEST(load_project, error_names_service)
{
    try {
        (void) load("services:\n  a:\n    image: x\n    ports: [\"0\"]\n");
        FAIL() << "expected exception";
    }
    catch (const berth::configuration_error& ex) {
        EXPECT_EQ(ex.service, berth::service_name("a"));
        EXPECT_NE(std::string(ex.what()).find("line 4: "), std::string::npos);
    }
}

TEST(load_project, from_file)
{
    const auto dir = test_directory("berth-descriptor-loader");
    std::filesystem::create_directories(dir);
    const auto file = dir / "compose.yaml";
    {
        std::ofstream os{file};
        os << example_descriptor;
    }
    EXPECT_EQ(berth::find_descriptor(dir), file);
    std::ostringstream diags;
    const auto p = berth::load_project(file, diags);
    EXPECT_EQ(p.name, berth::to_project_name(dir.filename().string()));
    EXPECT_TRUE(p.name.starts_with("berth-descriptor-loader-load_project-"));
    EXPECT_EQ(p.directory, dir);
    EXPECT_EQ(size(p.services), 3u);
    std::filesystem::remove_all(dir);
    EXPECT_FALSE(berth::find_descriptor(dir));
    EXPECT_THROW(berth::load_project(file, diags), berth::configuration_error);
}
