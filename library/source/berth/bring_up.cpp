#include <iomanip> // for std::quoted
#include <map>
#include <sstream> // for std::ostringstream

#include "berth/bring_up.hpp"
#include "berth/dependency_order.hpp"
#include "berth/spawn.hpp"
#include "berth/validate.hpp"

namespace berth {

namespace {

auto write_dry_run(std::ostream& os, const executable& command) -> void
{
    write_command_line(os, command) << "\n";
}

auto describe(const executable& command, const wait_status& status)
    -> std::string
{
    std::ostringstream os;
    write_command_line(os, command);
    os << ": " << status;
    return os.str();
}

/// @brief Runs the command to completion unless this is a dry run.
/// @throws spawn_error if the command can't be run.
auto run(const executable& command, const bring_up_options& opts)
    -> wait_status
{
    if (opts.dry_run) {
        write_dry_run(*opts.dry_run, command);
        return wait_exit_status{0};
    }
    return run_to_completion(command, opts.environment);
}

auto create_network(const project& p, deployment& result,
                    std::ostream& diags, const bring_up_options& opts)
    -> void
{
    const auto command = make_network_create(p, opts.engine);
    try {
        const auto status = run(command, opts);
        if (!is_success(status)) {
            diags << "warning: " << describe(command, status) << "\n";
        }
    }
    catch (const spawn_error& ex) {
        throw start_error{ex.what()};
    }
    // May have existed already, in which case it's still used.
    result.network = network_name(p);
}

auto build_image(const project& p, const service& s,
                 std::ostream& diags, const bring_up_options& opts) -> void
{
    const auto command = make_build_command(p, s, opts.engine);
    diags << "building " << std::quoted(s.name.get()) << "\n";
    try {
        const auto status = run(command, opts);
        if (!is_success(status)) {
            throw start_error{
                "build failed: " + describe(command, status), s.name
            };
        }
    }
    catch (const spawn_error& ex) {
        throw start_error{ex.what(), s.name};
    }
}

auto start_service(const project& p, const service& s,
                   const environment_map& env, deployment& result,
                   std::ostream& diags, const bring_up_options& opts)
    -> void
{
    auto instance = service_instance{};
    instance.container = container_name(p, s);
    instance.command = make_run_command(p, s, env, opts.engine);
    diags << "starting " << std::quoted(s.name.get()) << "\n";
    if (opts.dry_run) {
        write_dry_run(*opts.dry_run, instance.command);
    }
    else {
        try {
            instance.state = spawn(instance.command, opts.environment);
        }
        catch (const spawn_error& ex) {
            throw start_error{ex.what(), s.name};
        }
    }
    result.services.insert_or_assign(s.name, std::move(instance));
    result.started.push_back(s.name);
}

auto await_completion(const service_name& name, deployment& result)
    -> void
{
    auto& instance = result.services.at(name);
    auto status = wait_status{};
    if (auto p = std::get_if<owning_process_id>(&instance.state)) {
        status = p->wait();
        while (!is_terminated(status) &&
               (reference_process_id(*p) > no_process_id)) {
            status = p->wait();
        }
        instance.state = status;
    }
    else {
        // already settled, or a dry run
        return;
    }
    if (!is_success(status)) {
        throw start_error{
            "run failed: " + describe(instance.command, status), name
        };
    }
}

auto remove(const executable& command, std::ostream& diags,
            const bring_up_options& opts) -> void
{
    try {
        const auto status = run(command, opts);
        if (!is_success(status)) {
            diags << "warning: " << describe(command, status) << "\n";
        }
    }
    catch (const spawn_error& ex) {
        diags << "warning: " << ex.what() << "\n";
    }
}

}

auto operator<<(std::ostream& os, readiness value) -> std::ostream&
{
    switch (value) {
    case readiness::started:
        os << "started";
        break;
    case readiness::completed:
        os << "completed";
        break;
    }
    return os;
}

auto bring_up(const project& p, deployment& result, std::ostream& diags,
              const bring_up_options& opts) -> void
{
    validate(p, diags);
    const auto waves = start_waves(p);
    // Read every environment file before starting anything.
    auto envs = std::map<service_name, environment_map>{};
    for (auto&& entry: p.services) {
        envs.emplace(entry.name, service_environment(p, entry));
    }
    result.project_name = p.name;
    create_network(p, result, diags, opts);
    for (auto&& wave: waves) {
        for (auto&& name: wave) {
            const auto& entry = *find(p, name);
            if (std::holds_alternative<build_source>(entry.source)) {
                build_image(p, entry, diags, opts);
            }
        }
        for (auto&& name: wave) {
            start_service(p, *find(p, name), envs.at(name), result,
                          diags, opts);
        }
        if (opts.ready == readiness::completed) {
            for (auto&& name: wave) {
                await_completion(name, result);
            }
        }
    }
}

auto bring_up(const project& p, std::ostream& diags,
              const bring_up_options& opts) -> deployment
{
    auto result = deployment{};
    bring_up(p, result, diags, opts);
    return result;
}

auto tear_down(deployment& value, std::ostream& diags,
               const bring_up_options& opts) -> void
{
    wait(value);
    for (auto it = value.started.rbegin(); it != value.started.rend(); ++it) {
        const auto found = value.services.find(*it);
        if (found == value.services.end()) {
            continue;
        }
        diags << "removing " << std::quoted(found->second.container) << "\n";
        remove(make_remove_command(found->second.container, opts.engine),
               diags, opts);
    }
    if (!value.network.empty()) {
        remove(make_network_remove(value.network, opts.engine), diags, opts);
    }
    value.started.clear();
    value.services.clear();
    value.network.clear();
}

auto tear_down(const project& p, std::ostream& diags,
               const bring_up_options& opts) -> void
{
    auto value = deployment{};
    value.project_name = p.name;
    value.network = network_name(p);
    for (auto&& name: start_sequence(p)) {
        auto instance = service_instance{};
        instance.container = container_name(p, *find(p, name));
        value.services.insert_or_assign(name, std::move(instance));
        value.started.push_back(name);
    }
    tear_down(value, diags, opts);
}

}
