#include <fstream>
#include <iomanip> // for std::quoted
#include <set>
#include <sstream> // for std::ostringstream

#include <yaml-cpp/yaml.h>

#include "berth/configuration_error.hpp"
#include "berth/descriptor_loader.hpp"

namespace berth {

namespace {

constexpr auto assignment_token = '=';

auto where(const YAML::Node& node) -> std::string
{
    const auto mark = node.Mark();
    if (mark.is_null()) {
        return {};
    }
    std::ostringstream os;
    os << "line " << (mark.line + 1) << ": ";
    return os.str();
}

[[noreturn]]
auto throw_error(const YAML::Node& node, const std::string& what,
                 const service_name& name = {}) -> void
{
    std::ostringstream os;
    os << where(node);
    if (!name.get().empty()) {
        os << "service " << std::quoted(name.get()) << ": ";
    }
    os << what;
    throw configuration_error{os.str(), name};
}

auto to_scalar(const YAML::Node& node, const std::string& key,
               const service_name& name) -> std::string
{
    if (!node.IsScalar()) {
        throw_error(node, key + " must be a scalar", name);
    }
    return node.Scalar();
}

/// @brief Gets the scalar or sequence of scalars as strings.
auto to_strings(const YAML::Node& node, const std::string& key,
                const service_name& name) -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    if (node.IsScalar()) {
        result.push_back(node.Scalar());
        return result;
    }
    if (!node.IsSequence()) {
        throw_error(node, key + " must be a scalar or a sequence", name);
    }
    for (auto&& element: node) {
        result.push_back(to_scalar(element, key + " entry", name));
    }
    return result;
}

auto split_words(const std::string& string) -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    std::istringstream is{string};
    auto word = std::string{};
    while (is >> word) {
        result.push_back(word);
    }
    return result;
}

auto to_service_name(const YAML::Node& node) -> service_name
{
    const auto string = to_scalar(node, "service name", {});
    if (string.empty()) {
        throw_error(node, "empty service name");
    }
    try {
        return service_name{string};
    }
    catch (const charset_validator_error& ex) {
        std::ostringstream os;
        os << "invalid service name " << std::quoted(string) << ": ";
        os << ex.what();
        throw_error(node, os.str());
    }
}

auto to_dependency_name(const YAML::Node& node, const service_name& name)
    -> service_name
{
    const auto string = to_scalar(node, "depends_on entry", name);
    try {
        return service_name{string};
    }
    catch (const charset_validator_error& ex) {
        std::ostringstream os;
        os << "invalid dependency name " << std::quoted(string) << ": ";
        os << ex.what();
        throw_error(node, os.str(), name);
    }
}

auto parse_build(const YAML::Node& node, const service_name& name,
                 const std::filesystem::path& directory,
                 std::ostream& diags) -> build_source
{
    auto result = build_source{};
    if (node.IsScalar()) {
        result.context = node.Scalar();
    }
    else if (node.IsMap()) {
        for (auto&& entry: node) {
            const auto key = entry.first.Scalar();
            if (key == "context") {
                result.context = to_scalar(entry.second, "build.context", name);
            }
            else if (key == "dockerfile") {
                result.dockerfile = to_scalar(entry.second, "build.dockerfile",
                                              name);
            }
            else {
                diags << where(entry.first) << "service " << name;
                diags << ": ignoring unsupported build key ";
                diags << std::quoted(key) << "\n";
            }
        }
    }
    else {
        throw_error(node, "build must be a scalar or a mapping", name);
    }
    if (result.context.empty()) {
        throw_error(node, "empty build context", name);
    }
    if (result.dockerfile.empty()) {
        throw_error(node, "empty build file", name);
    }
    result.context = (directory / result.context).lexically_normal();
    if (!result.context.has_filename() && result.context.has_relative_path()) {
        result.context = result.context.parent_path(); // drop trailing '/'
    }
    return result;
}

auto parse_port(const YAML::Node& node, const service_name& name)
    -> port_mapping
{
    if (node.IsScalar()) {
        auto result = parse_port_mapping(node.Scalar());
        if (!result) {
            throw_error(node, result.error(), name);
        }
        return *result;
    }
    if (!node.IsMap()) {
        throw_error(node, "ports entry must be a scalar or a mapping", name);
    }
    auto result = port_mapping{};
    const auto target = node["target"];
    if (!target) {
        throw_error(node, "ports entry without target", name);
    }
    const auto container_port =
        parse_port_number(to_scalar(target, "ports.target", name));
    if (!container_port) {
        throw_error(target, container_port.error(), name);
    }
    result.container_port = *container_port;
    if (const auto published = node["published"]) {
        const auto host_port =
            parse_port_number(to_scalar(published, "ports.published", name));
        if (!host_port) {
            throw_error(published, host_port.error(), name);
        }
        result.host_port = *host_port;
    }
    if (const auto host_ip = node["host_ip"]) {
        result.host_ip = to_scalar(host_ip, "ports.host_ip", name);
    }
    if (const auto protocol = node["protocol"]) {
        const auto string = to_scalar(protocol, "ports.protocol", name);
        const auto found = to_transport(string);
        if (!found) {
            throw_error(protocol, "unknown protocol " + string, name);
        }
        result.protocol = *found;
    }
    return result;
}

auto parse_volume(const YAML::Node& node, const service_name& name)
    -> volume_binding
{
    if (node.IsScalar()) {
        auto result = parse_volume_binding(node.Scalar());
        if (!result) {
            throw_error(node, result.error(), name);
        }
        return *result;
    }
    if (!node.IsMap()) {
        throw_error(node, "volumes entry must be a scalar or a mapping", name);
    }
    auto result = volume_binding{};
    const auto source = node["source"];
    const auto target = node["target"];
    if (!source || !target) {
        throw_error(node, "volumes entry needs source and target", name);
    }
    result.source = to_scalar(source, "volumes.source", name);
    result.target = to_scalar(target, "volumes.target", name);
    if (const auto read_only = node["read_only"]) {
        if (read_only.as<bool>()) {
            result.mode = "ro";
        }
    }
    if (result.source.empty() || !result.target.starts_with('/')) {
        throw_error(node, "invalid volumes entry", name);
    }
    return result;
}

auto set_variable(environment_map& env, const std::string& key,
                  const std::optional<std::string>& value,
                  const environment_map& fallback,
                  const YAML::Node& node, const service_name& name,
                  std::ostream& diags) -> void
{
    try {
        const auto var = env_name{key};
        if (value) {
            env.insert_or_assign(var, env_value{*value});
            return;
        }
        if (const auto found = find(fallback, var)) {
            env.insert_or_assign(var, *found);
            return;
        }
        diags << where(node) << "service " << name << ": variable ";
        diags << std::quoted(key) << " not set, skipping\n";
    }
    catch (const charset_validator_error& ex) {
        throw_error(node, "invalid environment entry " + key + ": " + ex.what(),
                    name);
    }
}

auto parse_environment(const YAML::Node& node, const service_name& name,
                       const environment_map& fallback,
                       std::ostream& diags) -> environment_map
{
    auto result = environment_map{};
    if (node.IsMap()) {
        for (auto&& entry: node) {
            const auto key = to_scalar(entry.first, "environment key", name);
            const auto value = entry.second.IsNull()
                ? std::optional<std::string>{}
                : std::optional<std::string>{
                    to_scalar(entry.second, "environment value", name)
                };
            set_variable(result, key, value, fallback, entry.first, name,
                         diags);
        }
        return result;
    }
    if (!node.IsSequence()) {
        throw_error(node, "environment must be a mapping or a sequence", name);
    }
    for (auto&& entry: node) {
        const auto string = to_scalar(entry, "environment entry", name);
        const auto found = string.find(assignment_token);
        if (found == std::string::npos) {
            set_variable(result, string, {}, fallback, entry, name, diags);
            continue;
        }
        set_variable(result, string.substr(0u, found),
                     string.substr(found + 1u), fallback, entry, name, diags);
    }
    return result;
}

auto parse_depends_on(const YAML::Node& node, const service_name& name,
                      std::ostream& diags) -> std::vector<dependency>
{
    auto result = std::vector<dependency>{};
    if (node.IsSequence()) {
        for (auto&& entry: node) {
            result.push_back(dependency{to_dependency_name(entry, name)});
        }
        return result;
    }
    if (!node.IsMap()) {
        throw_error(node, "depends_on must be a sequence or a mapping", name);
    }
    for (auto&& entry: node) {
        auto dep = dependency{to_dependency_name(entry.first, name)};
        if (entry.second.IsMap()) {
            if (const auto condition = entry.second["condition"]) {
                const auto string = to_scalar(condition, "condition", name);
                const auto found = to_dependency_condition(string);
                if (!found) {
                    throw_error(condition, "unknown condition " + string,
                                name);
                }
                dep.condition = *found;
            }
        }
        else if (!entry.second.IsNull()) {
            throw_error(entry.second, "depends_on entry must be a mapping",
                        name);
        }
        if (dep.condition == dependency_condition::service_healthy) {
            diags << where(entry.first) << "service " << name;
            diags << ": no health checks are supported, treating ";
            diags << dep.condition << " of " << dep.name << " as ";
            diags << dependency_condition::service_started << "\n";
        }
        result.push_back(std::move(dep));
    }
    return result;
}

auto parse_service(const YAML::Node& key, const YAML::Node& node,
                   const std::filesystem::path& directory,
                   const environment_map& fallback,
                   std::ostream& diags) -> service
{
    auto result = service{};
    result.name = to_service_name(key);
    const auto& name = result.name;
    if (!node.IsMap()) {
        throw_error(node, "declaration must be a mapping", name);
    }
    auto has_image = false;
    auto has_build = false;
    for (auto&& entry: node) {
        const auto field = to_scalar(entry.first, "key", name);
        const auto& value = entry.second;
        if (field == "image") {
            has_image = true;
            result.source = image_source{to_scalar(value, field, name)};
        }
        else if (field == "build") {
            has_build = true;
            result.source = parse_build(value, name, directory, diags);
        }
        else if (field == "ports") {
            if (!value.IsSequence()) {
                throw_error(value, "ports must be a sequence", name);
            }
            for (auto&& port: value) {
                result.ports.push_back(parse_port(port, name));
            }
        }
        else if (field == "env_file") {
            for (auto&& path: to_strings(value, field, name)) {
                result.env_files.push_back((directory / path).lexically_normal());
            }
        }
        else if (field == "environment") {
            result.environment = parse_environment(value, name, fallback,
                                                   diags);
        }
        else if (field == "depends_on") {
            result.depends_on = parse_depends_on(value, name, diags);
        }
        else if (field == "volumes") {
            if (!value.IsSequence()) {
                throw_error(value, "volumes must be a sequence", name);
            }
            for (auto&& volume: value) {
                result.volumes.push_back(resolve(parse_volume(volume, name),
                                                 directory));
            }
        }
        else if (field == "command") {
            result.command = value.IsScalar()
                ? split_words(value.Scalar())
                : to_strings(value, field, name);
        }
        else {
            diags << where(entry.first) << "service " << name;
            diags << ": ignoring unsupported key " << std::quoted(field);
            diags << "\n";
        }
    }
    if (has_image && has_build) {
        throw_error(node, "image and build are mutually exclusive", name);
    }
    if (!has_image && !has_build) {
        throw_error(node, "neither image nor build given", name);
    }
    if (const auto p = std::get_if<image_source>(&result.source);
        p && p->reference.empty()) {
        throw_error(node, "empty image reference", name);
    }
    return result;
}

auto parse_project(const YAML::Node& root, std::ostream& diags,
                   const load_options& opts) -> project
{
    if (!root.IsMap()) {
        throw_error(root, "descriptor must be a mapping");
    }
    auto result = project{};
    result.directory = opts.directory.empty()
        ? std::filesystem::current_path()
        : std::filesystem::absolute(opts.directory).lexically_normal();
    result.name = opts.project_name;
    for (auto&& entry: root) {
        const auto key = to_scalar(entry.first, "key", {});
        if (key == "services") {
            continue;
        }
        if (key == "name") {
            if (result.name.empty()) {
                result.name = to_scalar(entry.second, key, {});
            }
        }
        else if (key != "version") {
            diags << where(entry.first) << "ignoring unsupported key ";
            diags << std::quoted(key) << "\n";
        }
    }
    if (result.name.empty()) {
        result.name = result.directory.filename().string();
    }
    result.name = to_project_name(result.name);
    if (result.name.empty()) {
        throw configuration_error{"cannot determine project name"};
    }
    const auto services = root["services"];
    if (!services || services.IsNull()) {
        throw_error(root, "no services declared");
    }
    if (!services.IsMap()) {
        throw_error(services, "services must be a mapping");
    }
    auto names = std::set<service_name>{};
    for (auto&& entry: services) {
        auto parsed = parse_service(entry.first, entry.second,
                                    result.directory, opts.environment,
                                    diags);
        if (!names.insert(parsed.name).second) {
            throw_error(entry.first, "duplicate declaration", parsed.name);
        }
        result.services.push_back(std::move(parsed));
    }
    return result;
}

}

auto load_project(std::istream& is, std::ostream& diags,
                  const load_options& opts) -> project
{
    try {
        return parse_project(YAML::Load(is), diags, opts);
    }
    catch (const YAML::Exception& ex) {
        throw configuration_error{ex.what()};
    }
}

auto load_project(const std::filesystem::path& file, std::ostream& diags,
                  load_options opts) -> project
{
    std::ifstream is{file};
    if (!is.is_open()) {
        std::ostringstream os;
        os << "cannot open descriptor " << file;
        throw configuration_error{os.str()};
    }
    if (opts.directory.empty()) {
        opts.directory = std::filesystem::absolute(file).parent_path();
    }
    try {
        return load_project(is, diags, opts);
    }
    catch (const configuration_error& ex) {
        std::ostringstream os;
        os << file.string() << ": " << ex.what();
        throw configuration_error{os.str(), ex.service};
    }
}

auto find_descriptor(const std::filesystem::path& directory)
    -> std::optional<std::filesystem::path>
{
    for (auto&& name: default_descriptor_names) {
        const auto path = directory / name;
        auto ec = std::error_code{};
        if (std::filesystem::is_regular_file(path, ec) && !ec) {
            return path;
        }
    }
    return {};
}

}
