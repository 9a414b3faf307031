#include <algorithm> // for std::any_of

#include "berth/service.hpp"

namespace berth {

auto operator<<(std::ostream& os, const image_source& value)
    -> std::ostream&
{
    os << "image{" << value.reference << "}";
    return os;
}

auto operator<<(std::ostream& os, const build_source& value)
    -> std::ostream&
{
    os << "build{";
    os << ".context=" << value.context;
    os << ",.dockerfile=" << value.dockerfile;
    os << "}";
    return os;
}

auto context_path(const build_source& value,
                  const std::filesystem::path& directory)
    -> std::filesystem::path
{
    return (directory / value.context).lexically_normal();
}

auto dockerfile_path(const build_source& value,
                     const std::filesystem::path& directory)
    -> std::filesystem::path
{
    return (context_path(value, directory) / value.dockerfile)
        .lexically_normal();
}

auto operator<<(std::ostream& os, dependency_condition value)
    -> std::ostream&
{
    switch (value) {
    case dependency_condition::service_started:
        os << "service_started";
        break;
    case dependency_condition::service_healthy:
        os << "service_healthy";
        break;
    case dependency_condition::service_completed_successfully:
        os << "service_completed_successfully";
        break;
    }
    return os;
}

auto to_dependency_condition(std::string_view string)
    -> std::optional<dependency_condition>
{
    if (string == "service_started") {
        return dependency_condition::service_started;
    }
    if (string == "service_healthy") {
        return dependency_condition::service_healthy;
    }
    if (string == "service_completed_successfully") {
        return dependency_condition::service_completed_successfully;
    }
    return {};
}

auto operator<<(std::ostream& os, const service& value) -> std::ostream&
{
    os << "service{";
    os << ".name=" << value.name;
    os << ",.source=" << value.source;
    os << ",.ports={";
    auto prefix = "";
    for (auto&& port: value.ports) {
        os << prefix << port;
        prefix = ",";
    }
    os << "},.env_files={";
    prefix = "";
    for (auto&& path: value.env_files) {
        os << prefix << path;
        prefix = ",";
    }
    os << "},.environment=" << value.environment;
    os << ",.depends_on={";
    prefix = "";
    for (auto&& dep: value.depends_on) {
        os << prefix << dep.name;
        prefix = ",";
    }
    os << "},.volumes={";
    prefix = "";
    for (auto&& volume: value.volumes) {
        os << prefix << volume;
        prefix = ",";
    }
    os << "}}";
    return os;
}

auto pretty_print(std::ostream& os, const service& value,
                  const std::string& indent) -> void
{
    const auto sub = indent + "  ";
    const auto item = sub + "- ";
    os << indent << value.name << ":\n";
    std::visit(detail::overloaded{
        [&](const image_source& source) {
            os << sub << "image: " << source.reference << "\n";
        },
        [&](const build_source& source) {
            os << sub << "build:\n";
            os << sub << "  context: " << source.context.string() << "\n";
            os << sub << "  dockerfile: " << source.dockerfile.string() << "\n";
        }
    }, value.source);
    if (!value.command.empty()) {
        os << sub << "command:\n";
        for (auto&& arg: value.command) {
            os << item << arg << "\n";
        }
    }
    if (!value.depends_on.empty()) {
        os << sub << "depends_on:\n";
        for (auto&& dep: value.depends_on) {
            os << sub << "  " << dep.name << ":\n";
            os << sub << "    condition: " << dep.condition << "\n";
        }
    }
    if (!value.env_files.empty()) {
        os << sub << "env_file:\n";
        for (auto&& path: value.env_files) {
            os << item << path.string() << "\n";
        }
    }
    if (!value.environment.empty()) {
        os << sub << "environment:\n";
        for (auto&& entry: value.environment) {
            os << sub << "  " << entry.first << ": " << entry.second << "\n";
        }
    }
    if (!value.ports.empty()) {
        os << sub << "ports:\n";
        for (auto&& port: value.ports) {
            os << item << '"' << port << '"' << "\n";
        }
    }
    if (!value.volumes.empty()) {
        os << sub << "volumes:\n";
        for (auto&& volume: value.volumes) {
            os << item << volume << "\n";
        }
    }
}

auto depends_on(const service& value, const service_name& name) -> bool
{
    return std::any_of(begin(value.depends_on), end(value.depends_on),
                       [&name](const dependency& dep){
        return dep.name == name;
    });
}

}
