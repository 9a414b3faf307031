#include <cctype> // for std::tolower
#include <initializer_list>
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::invalid_argument

#include "berth/engine.hpp"
#include "berth/env_file.hpp"

namespace berth {

namespace {

auto make_command(const engine_options& opts,
                  std::initializer_list<std::string> args) -> executable
{
    auto result = executable{};
    result.file = opts.program;
    result.arguments.push_back(opts.program.string());
    result.arguments.insert(end(result.arguments), args);
    return result;
}

auto to_string(const port_mapping& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

auto to_exposed(const port_mapping& value) -> std::string
{
    auto result = std::to_string(value.container_port);
    if (value.protocol == transport::udp) {
        result += "/udp";
    }
    return result;
}

auto to_string(const volume_binding& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

auto to_image(const project& p, const service& s) -> std::string
{
    if (const auto image = std::get_if<image_source>(&s.source)) {
        return image->reference;
    }
    return image_name(p, s);
}

}

auto container_name(const project& p, const service& s) -> std::string
{
    return p.name + "-" + s.name.get() + "-1";
}

auto image_name(const project& p, const service& s) -> std::string
{
    auto result = p.name + "-" + s.name.get();
    for (auto& c: result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

auto network_name(const project& p) -> std::string
{
    return p.name + "_default";
}

auto service_environment(const project& p, const service& s)
    -> environment_map
{
    auto result = environment_map{};
    for (auto&& file: s.env_files) {
        merge(result, load_env_file(p.directory / file));
    }
    merge(result, s.environment);
    return result;
}

auto make_network_create(const project& p, const engine_options& opts)
    -> executable
{
    return make_command(opts, {"network", "create", network_name(p)});
}

auto make_build_command(const project& p, const service& s,
                        const engine_options& opts) -> executable
{
    const auto build = std::get_if<build_source>(&s.source);
    if (!build) {
        throw std::invalid_argument{
            "service " + s.name.get() + " isn't built from source"
        };
    }
    return make_command(opts, {
        "build",
        "-f", dockerfile_path(*build, p.directory).string(),
        "-t", image_name(p, s),
        context_path(*build, p.directory).string(),
    });
}

auto make_run_command(const project& p, const service& s,
                      const environment_map& env,
                      const engine_options& opts) -> executable
{
    auto result = make_command(opts, {
        "run", "-d",
        "--name", container_name(p, s),
        "--network", network_name(p),
        "--network-alias", s.name.get(),
    });
    auto& args = result.arguments;
    for (auto&& entry: env) {
        args.push_back("-e");
        args.push_back(entry.first.get() + "=" + entry.second.get());
    }
    for (auto&& port: s.ports) {
        if (is_published(port)) {
            args.push_back("-p");
            args.push_back(to_string(port));
        }
        else {
            args.push_back("--expose");
            args.push_back(to_exposed(port));
        }
    }
    for (auto&& volume: s.volumes) {
        args.push_back("-v");
        args.push_back(to_string(volume));
    }
    args.push_back(to_image(p, s));
    args.insert(end(args), begin(s.command), end(s.command));
    return result;
}

auto make_remove_command(const std::string& container,
                         const engine_options& opts) -> executable
{
    return make_command(opts, {"rm", "-f", container});
}

auto make_network_remove(const std::string& network,
                         const engine_options& opts) -> executable
{
    return make_command(opts, {"network", "rm", network});
}

}
