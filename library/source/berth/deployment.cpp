#include <csignal> // for kill
#include <iomanip> // for std::setw, std::quoted

#include "berth/deployment.hpp"
#include "berth/os_error_code.hpp"
#include "berth/wait_option.hpp"

namespace berth {

namespace {

constexpr auto name_width = 16;
constexpr auto container_width = 32;

auto settle(service_instance& instance, wait_option flags) -> void
{
    if (const auto p = std::get_if<owning_process_id>(&instance.state)) {
        const auto status = p->wait(flags);
        if (is_terminated(status) ||
            (reference_process_id(*p) <= no_process_id)) {
            instance.state = status;
        }
    }
}

}

auto operator<<(std::ostream& os, const service_instance& value)
    -> std::ostream&
{
    os << "service_instance{";
    os << ".container=" << value.container;
    os << ",.command=" << value.command;
    os << ",.state=" << value.state;
    os << "}";
    return os;
}

auto update(deployment& value) -> void
{
    for (auto&& entry: value.services) {
        settle(entry.second, wait_options::nohang());
    }
}

auto wait(deployment& value) -> void
{
    for (auto&& entry: value.services) {
        while (std::holds_alternative<owning_process_id>(entry.second.state)) {
            settle(entry.second, wait_option{});
        }
    }
}

auto send_signal(signal sig, const deployment& value, std::ostream& diags)
    -> void
{
    for (auto&& entry: value.services) {
        const auto p = std::get_if<owning_process_id>(&entry.second.state);
        if (!p || (reference_process_id(*p) <= no_process_id)) {
            continue;
        }
        diags << "sending " << sig << " to ";
        diags << std::quoted(entry.first.get()) << "\n";
        if (::kill(int(reference_process_id(*p)), int(sig)) == -1) {
            diags << "kill(" << reference_process_id(*p);
            diags << "," << sig << ") failed: ";
            diags << last_os_error_code() << "\n";
        }
    }
}

auto pretty_print(std::ostream& os, const deployment& value) -> void
{
    os << std::left;
    os << std::setw(name_width) << "SERVICE";
    os << std::setw(container_width) << "CONTAINER";
    os << "RUN COMMAND\n";
    for (auto&& name: value.started) {
        const auto found = value.services.find(name);
        if (found == value.services.end()) {
            continue;
        }
        const auto& instance = found->second;
        os << std::setw(name_width) << name.get();
        os << std::setw(container_width) << instance.container;
        std::visit(detail::overloaded{
            [&os](const owning_process_id& pid){
                os << "running " << reference_process_id(pid);
            },
            [&os](const wait_status& status){
                os << status;
            },
        }, instance.state);
        os << "\n";
    }
    os << std::right;
}

}
