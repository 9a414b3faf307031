#include <iomanip> // for std::quoted
#include <map>
#include <sstream> // for std::ostringstream
#include <system_error> // for std::error_code

#include "berth/configuration_error.hpp"
#include "berth/dependency_order.hpp"
#include "berth/validate.hpp"

namespace berth {

namespace {

[[noreturn]]
auto throw_error(const service& entry, const std::string& what) -> void
{
    std::ostringstream os;
    os << "service " << std::quoted(entry.name.get()) << ": " << what;
    throw configuration_error{os.str(), entry.name};
}

auto check_image(const service& entry) -> void
{
    if (const auto p = std::get_if<image_source>(&entry.source)) {
        if (p->reference.empty()) {
            throw_error(entry, "empty image reference");
        }
    }
}

auto check_exists(const service& entry,
                  const std::filesystem::path& path,
                  const char* what) -> void
{
    auto ec = std::error_code{};
    if (!exists(path, ec) || ec) {
        std::ostringstream os;
        os << what << " " << path << " not found";
        throw_error(entry, os.str());
    }
}

auto warn_shared_volumes(const project& value, std::ostream& diags) -> void
{
    auto users = std::map<std::string, service_name>{};
    for (auto&& entry: value.services) {
        for (auto&& volume: entry.volumes) {
            if (!is_host_path(volume)) {
                continue;
            }
            const auto [it, inserted] = users.emplace(volume.source,
                                                      entry.name);
            if (!inserted && (it->second != entry.name)) {
                diags << "warning: host path " << std::quoted(volume.source);
                diags << " bound by both " << std::quoted(it->second.get());
                diags << " and " << std::quoted(entry.name.get()) << "\n";
            }
        }
    }
}

}

auto check_dependencies(const project& value) -> void
{
    // start_order does both checks
    (void) start_order(value);
}

auto check_ports(const project& value) -> void
{
    const auto& services = value.services;
    for (auto i = std::size_t{}; i < size(services); ++i) {
        for (auto j = std::size_t{}; j <= i; ++j) {
            for (auto&& port: services[i].ports) {
                for (auto&& other: services[j].ports) {
                    if ((&port == &other) || !conflicts(port, other)) {
                        continue;
                    }
                    std::ostringstream os;
                    os << "host port " << port.host_port << "/";
                    os << port.protocol << " already published by ";
                    os << std::quoted(services[j].name.get());
                    throw_error(services[i], os.str());
                }
            }
        }
    }
}

auto check_files(const project& value) -> void
{
    for (auto&& entry: value.services) {
        for (auto&& file: entry.env_files) {
            check_exists(entry, value.directory / file, "env file");
        }
        if (const auto p = std::get_if<build_source>(&entry.source)) {
            check_exists(entry, context_path(*p, value.directory),
                         "build context");
            check_exists(entry, dockerfile_path(*p, value.directory),
                         "build file");
        }
    }
}

auto validate(const project& value, std::ostream& diags) -> void
{
    for (auto&& entry: value.services) {
        check_image(entry);
    }
    check_dependencies(value);
    check_ports(value);
    check_files(value);
    warn_shared_volumes(value, diags);
}

}
